#include "stream_enums.hpp"

#include <array>
#include <utility>

namespace workstream::model {

namespace {

constexpr std::array<std::pair<StreamStatus, std::string_view>, 6> kStatuses = {{
    {StreamStatus::kInitializing, "initializing"},
    {StreamStatus::kActive, "active"},
    {StreamStatus::kBlocked, "blocked"},
    {StreamStatus::kPaused, "paused"},
    {StreamStatus::kCompleted, "completed"},
    {StreamStatus::kArchived, "archived"},
}};

constexpr std::array<std::pair<StreamCategory, std::string_view>, 6> kCategories = {{
    {StreamCategory::kFrontend, "frontend"},
    {StreamCategory::kBackend, "backend"},
    {StreamCategory::kInfrastructure, "infrastructure"},
    {StreamCategory::kTesting, "testing"},
    {StreamCategory::kDocumentation, "documentation"},
    {StreamCategory::kRefactoring, "refactoring"},
}};

constexpr std::array<std::pair<StreamPriority, std::string_view>, 4> kPriorities = {{
    {StreamPriority::kCritical, "critical"},
    {StreamPriority::kHigh, "high"},
    {StreamPriority::kMedium, "medium"},
    {StreamPriority::kLow, "low"},
}};

constexpr std::array<std::pair<HistoryEventType, std::string_view>, 5> kEventTypes = {{
    {HistoryEventType::kCreated, "created"},
    {HistoryEventType::kStatusChanged, "status_changed"},
    {HistoryEventType::kProgressUpdated, "progress_updated"},
    {HistoryEventType::kCompleted, "completed"},
    {HistoryEventType::kArchived, "archived"},
}};

constexpr std::array<std::pair<SummaryJobStatus, std::string_view>, 4> kJobStatuses = {{
    {SummaryJobStatus::kPending, "pending"},
    {SummaryJobStatus::kRunning, "running"},
    {SummaryJobStatus::kDone, "done"},
    {SummaryJobStatus::kFailed, "failed"},
}};

template <typename E, std::size_t N>
std::string_view Lookup(const std::array<std::pair<E, std::string_view>, N>& table, E value) {
  for (const auto& [e, name] : table) {
    if (e == value) return name;
  }
  return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> Parse(const std::array<std::pair<E, std::string_view>, N>& table, std::string_view text) {
  for (const auto& [e, name] : table) {
    if (name == text) return e;
  }
  return std::nullopt;
}

template <typename E, std::size_t N>
std::string Join(const std::array<std::pair<E, std::string_view>, N>& table) {
  std::string out;
  for (const auto& entry : table) {
    if (!out.empty()) out += ", ";
    out += entry.second;
  }
  return out;
}

} // namespace

std::string_view ToString(StreamStatus status) {
  return Lookup(kStatuses, status);
}

std::string_view ToString(StreamCategory category) {
  return Lookup(kCategories, category);
}

std::string_view ToString(StreamPriority priority) {
  return Lookup(kPriorities, priority);
}

std::string_view ToString(HistoryEventType type) {
  return Lookup(kEventTypes, type);
}

std::string_view ToString(SummaryJobStatus status) {
  return Lookup(kJobStatuses, status);
}

std::optional<StreamStatus> ParseStreamStatus(std::string_view text) {
  return Parse(kStatuses, text);
}

std::optional<StreamCategory> ParseStreamCategory(std::string_view text) {
  return Parse(kCategories, text);
}

std::optional<StreamPriority> ParseStreamPriority(std::string_view text) {
  return Parse(kPriorities, text);
}

std::optional<HistoryEventType> ParseHistoryEventType(std::string_view text) {
  return Parse(kEventTypes, text);
}

std::optional<SummaryJobStatus> ParseSummaryJobStatus(std::string_view text) {
  return Parse(kJobStatuses, text);
}

std::string AllowedStatuses() {
  return Join(kStatuses);
}

std::string AllowedCategories() {
  return Join(kCategories);
}

std::string AllowedPriorities() {
  return Join(kPriorities);
}

} // namespace workstream::model
