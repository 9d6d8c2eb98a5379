#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace workstream::core {

/*
  StreamLedger

  Single source of truth for intended stream state. Every public call is
  one short transaction on the repository.

  Failure model:
    - unknown id          -> util::NotFound
    - duplicate id        -> util::AlreadyExists
    - bad progress/enum   -> util::InvalidArgument
    - commit insert       -> typed db::Result (duplicates are not errors)

  Status and progress changes are paired with HistoryEvents inside the
  same transaction.
*/
class StreamLedger {
 public:
  explicit StreamLedger(std::shared_ptr<db::Repository> repository);

  // Forces status=initializing, progress=0 and fresh timestamps.
  db::model::StreamRecord Insert(db::model::StreamRecord stream);

  // Empty update is a no-op (updated_at untouched). status=completed is
  // handled as Complete().
  db::model::StreamRecord Update(const std::string& id, const db::model::StreamUpdate& update);

  // Keeps the first completed_at when the stream is already completed.
  db::model::StreamRecord Complete(const std::string& id);

  std::optional<db::model::StreamRecord> Get(const std::string& id);

  std::vector<db::model::StreamListRow> List(const db::model::StreamFilter& filter = {});

  // Irreversible: commits, history and the stream row go together.
  void Delete(const std::string& id);

  // OK, AlreadyExists (duplicate hash) or a hard error code. Touches the
  // owning stream's updated_at on success.
  db::Result AddCommit(db::model::CommitRecord commit);

  void AddHistoryEvent(db::model::HistoryRecord event);

  std::vector<db::model::HistoryRecord> History(const std::string& id);

  std::vector<db::model::CommitRecord> ListCommits(const std::optional<std::string>& stream_id, int limit = 20);

  db::model::QuickStats Stats();

  // Synthetic stream that owns main-branch commits.
  void EnsureMainStream(const std::string& project_root, const std::string& base_branch = "main");

 private:
  std::shared_ptr<db::Repository> repository_;
};

inline constexpr const char* kMainStreamId = "main";

} // namespace workstream::core
