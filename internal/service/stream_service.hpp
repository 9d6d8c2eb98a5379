#pragma once

#include <mutex>
#include <string>

#include "internal/db/model/stream_record.hpp"
#include "internal/retirement/retirement_service.hpp"
#include "service_context.hpp"
#include "workstream/v1.hpp"

namespace workstream::service {

/*
  Collaborator operations on streams and their commits.

  Failures surface as util exceptions (NotFound, InvalidArgument,
  InvalidState, AlreadyExists); bulk retirement reports per-stream
  outcomes instead of throwing.
*/
class StreamService {
 public:
  explicit StreamService(ServiceContext ctx);

  workstream::v1::ListStreamsResponse ListStreams(const workstream::v1::ListStreamsRequest& req);

  workstream::v1::Stream GetStream(const std::string& id);

  workstream::v1::AddStreamResponse AddStream(const workstream::v1::AddStreamRequest& req);

  workstream::v1::UpdateStreamResponse UpdateStream(const std::string& id, const workstream::v1::UpdateStreamRequest& req);

  // Retires a completed stream and removes it from the ledger, even when
  // some retirement steps fail.
  workstream::v1::ArchiveStreamResponse ArchiveStream(const std::string& id, const workstream::v1::ArchiveStreamRequest& req);

  workstream::v1::ArchiveBulkResponse ArchiveBulk(const workstream::v1::ArchiveBulkRequest& req);

  workstream::v1::HistoryResponse History(const std::string& id);

  workstream::v1::AddCommitResponse AddCommit(const workstream::v1::AddCommitRequest& req);

  workstream::v1::ListCommitsResponse ListCommits(const workstream::v1::ListCommitsRequest& req);

 private:
  // Retirement, final history event and ledger delete for a completed stream.
  retirement::RetirementResult Retire(const db::model::StreamRecord& stream, const std::string& summary, const retirement::RetireFlags& flags);

  ServiceContext ctx_;
  // retirements commit and push from the shared checkout one at a time
  std::mutex retire_mu_;
};

} // namespace workstream::service
