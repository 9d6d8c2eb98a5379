#pragma once

namespace workstream::db::model {

// Dashboard counters; the synthetic main stream is not counted.
struct QuickStats {
  int active_streams  = 0; // not completed/archived
  int in_progress     = 0; // status active
  int blocked         = 0;
  int paused          = 0;
  int completed_today = 0;
  int total_commits   = 0;
  int commits_today   = 0;
};

} // namespace workstream::db::model
