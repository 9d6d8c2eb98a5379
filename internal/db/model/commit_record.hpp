#pragma once

#include <cstdint>
#include <string>

namespace workstream::db::model {

struct CommitRecord {
  int64_t     id = 0;
  std::string stream_id;
  std::string commit_hash;
  std::string message;
  std::string author;
  int         files_changed = 0;
  std::string timestamp;
};

} // namespace workstream::db::model
