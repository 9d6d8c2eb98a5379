#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace workstream::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t secs  = static_cast<std::time_t>(millis / 1000);
  int         frac  = static_cast<int>(millis % 1000);
  if (frac < 0) {
    frac += 1000;
    --secs;
  }

  std::tm utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, frac);
  return buf;
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
    return std::nullopt;
  }

  std::size_t pos    = static_cast<std::size_t>(consumed);
  long        millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    long scale = 100;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }

  long offset_sec = 0;
  if (pos < text.size()) {
    const char sign = text[pos];
    if (sign == 'Z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      int off_h = 0, off_m = 0;
      if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
        return std::nullopt;
      }
      offset_sec = (off_h * 3600L + off_m * 60L) * (sign == '-' ? -1 : 1);
      pos += 6;
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t utc = timegm(&tm) - offset_sec;
  return TimePoint{} + std::chrono::seconds(utc) + std::chrono::milliseconds(millis);
}

std::string NormalizeIso8601(const std::string& text) {
  auto parsed = ParseIso8601(text);
  return parsed ? ToIso8601(*parsed) : text;
}

TimePoint StartOfLocalDay(TimePoint tp) {
  std::time_t secs = Clock::to_time_t(tp);
  std::tm     local{};
  localtime_r(&secs, &local);
  local.tm_hour  = 0;
  local.tm_min   = 0;
  local.tm_sec   = 0;
  local.tm_isdst = -1;
  return Clock::from_time_t(std::mktime(&local));
}

std::string RelativeTime(TimePoint then, TimePoint now) {
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(now - then).count();
  const auto hours   = minutes / 60;
  const auto days    = hours / 24;

  auto plural = [](long long n, const char* unit) {
    return std::to_string(n) + " " + unit + (n == 1 ? "" : "s") + " ago";
  };

  if (days > 0) return plural(days, "day");
  if (hours > 0) return plural(hours, "hour");
  if (minutes > 0) return plural(minutes, "minute");
  return "just now";
}

} // namespace workstream::util
