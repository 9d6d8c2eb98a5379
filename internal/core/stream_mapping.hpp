#pragma once

#include "internal/db/model/commit_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/stats_record.hpp"
#include "internal/db/model/stream_record.hpp"
#include "internal/db/model/summary_job_record.hpp"
#include "internal/util/time.hpp"
#include "workstream/v1.hpp"

namespace workstream::core {

/*
  Record -> wire message conversions shared by the HTTP services and
  workstreamctl.
*/

workstream::v1::Stream       ToProto(const db::model::StreamRecord& record);
workstream::v1::Stream       ToProto(const db::model::StreamListRow& row, util::TimePoint now);
workstream::v1::Commit       ToProto(const db::model::CommitRecord& record);
workstream::v1::HistoryEvent ToProto(const db::model::HistoryRecord& record);
workstream::v1::SummaryJob   ToProto(const db::model::SummaryJobRecord& record);
workstream::v1::StatsResponse ToProto(const db::model::QuickStats& stats);

} // namespace workstream::core
