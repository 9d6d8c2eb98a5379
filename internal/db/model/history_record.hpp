#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/stream_enums.hpp"

namespace workstream::db::model {

/*
  Append-only audit row. Never updated; removed only with its stream.
*/
struct HistoryRecord {
  int64_t                                id = 0;
  std::string                            stream_id;
  workstream::model::HistoryEventType    event_type = workstream::model::HistoryEventType::kCreated;
  std::optional<std::string>             old_value;
  std::optional<std::string>             new_value;
  std::string                            timestamp;
};

} // namespace workstream::db::model
