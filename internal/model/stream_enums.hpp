#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace workstream::model {

/*
  Stream lifecycle:

    initializing -> active <-> {blocked, paused} -> completed -> archived

  The ledger does not enforce transitions; completed is the only status
  with a side effect (completed_at).
*/
enum class StreamStatus : std::uint8_t {
  kInitializing = 0,
  kActive       = 1,
  kBlocked      = 2,
  kPaused       = 3,
  kCompleted    = 4,
  kArchived     = 5,
};

enum class StreamCategory : std::uint8_t {
  kFrontend = 0,
  kBackend,
  kInfrastructure,
  kTesting,
  kDocumentation,
  kRefactoring,
};

enum class StreamPriority : std::uint8_t {
  kCritical = 0,
  kHigh,
  kMedium,
  kLow,
};

enum class HistoryEventType : std::uint8_t {
  kCreated = 0,
  kStatusChanged,
  kProgressUpdated,
  kCompleted,
  kArchived,
};

enum class SummaryJobStatus : std::uint8_t {
  kPending = 0,
  kRunning,
  kDone,
  kFailed,
};

constexpr bool IsTerminal(StreamStatus status) {
  return status == StreamStatus::kCompleted || status == StreamStatus::kArchived;
}

// Statuses reconciliation leaves alone for a stream with a live worktree.
constexpr bool IsWorking(StreamStatus status) {
  return status == StreamStatus::kActive || status == StreamStatus::kBlocked || status == StreamStatus::kPaused;
}

std::string_view ToString(StreamStatus status);
std::string_view ToString(StreamCategory category);
std::string_view ToString(StreamPriority priority);
std::string_view ToString(HistoryEventType type);
std::string_view ToString(SummaryJobStatus status);

std::optional<StreamStatus>     ParseStreamStatus(std::string_view text);
std::optional<StreamCategory>   ParseStreamCategory(std::string_view text);
std::optional<StreamPriority>   ParseStreamPriority(std::string_view text);
std::optional<HistoryEventType> ParseHistoryEventType(std::string_view text);
std::optional<SummaryJobStatus> ParseSummaryJobStatus(std::string_view text);

// Comma separated list of accepted values, for validation messages.
std::string AllowedStatuses();
std::string AllowedCategories();
std::string AllowedPriorities();

} // namespace workstream::model
