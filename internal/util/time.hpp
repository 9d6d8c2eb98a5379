#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace workstream::util {

/*
  Clock and timestamp helpers.

  Ledger timestamps are ISO-8601 UTC with millisecond precision
  (2026-01-02T03:04:05.678Z) so that text order equals time order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::string ToIso8601(TimePoint tp);

// Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and optional fractional seconds
// (git's %aI output as well as our own timestamps).
std::optional<TimePoint> ParseIso8601(const std::string& text);

// Re-renders any accepted ISO-8601 string in the canonical ledger form.
std::string NormalizeIso8601(const std::string& text);

// Local midnight of the day containing tp.
TimePoint StartOfLocalDay(TimePoint tp);

// "3 days ago", "1 hour ago", "5 minutes ago", "just now".
std::string RelativeTime(TimePoint then, TimePoint now);

} // namespace workstream::util
