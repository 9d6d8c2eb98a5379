#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace workstream::runtime::config {
class RuntimeConfig;
}

namespace workstream::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs the "workstream" logger as spdlog's default: a console sink
// (logging.console) plus an appending file sink when logging.file is set.
// Safe to call again; the previous logger is replaced.
void InitializeLogging(const workstream::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// "key=value key2="quoted value"", the suffix Log() appends to a message.
std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace workstream::observability

#define WORKSTREAM_LOG_DEBUG(message, ...) ::workstream::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define WORKSTREAM_LOG_INFO(message, ...) ::workstream::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define WORKSTREAM_LOG_WARN(message, ...) ::workstream::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define WORKSTREAM_LOG_ERROR(message, ...) ::workstream::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
