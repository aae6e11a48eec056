#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace recsync::runtime::config {
class RuntimeConfig;
}

namespace recsync::observability {

/*
  One-line key=value logging on the "record-sync" spdlog logger (stderr).

    RECSYNC_LOG_INFO("sync finished", {StringField("scope", scope), UintField("uploaded", n)});

  Fields carry ids, counts and error text only. Plaintext record data and key
  material never go into a field.
*/

struct LogField {
  std::string key;
  std::string value;
};

// Quoted on output when the value has spaces, quotes or '='.
LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Level, pattern and trace-id suffix come from the logging config block;
// RECSYNC_LOG_LEVEL, RECSYNC_LOG_PATTERN and RECSYNC_LOG_INCLUDE_TRACE_CONTEXT
// override it. Call before anything logs.
void InitializeLogging(const recsync::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace recsync::observability

#define RECSYNC_LOG_DEBUG(message, ...) ::recsync::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define RECSYNC_LOG_INFO(message, ...) ::recsync::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define RECSYNC_LOG_WARN(message, ...) ::recsync::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define RECSYNC_LOG_ERROR(message, ...) ::recsync::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
