#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow::runtime::config {
class RuntimeConfig;
}

namespace jobflow::observability {

// key=value pair appended to a log line
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// key=[1,2,3]; long lists are cut after the first few IDs.
LogField IdsField(std::string_view key, const std::vector<std::uint64_t>& ids);

// key=a,b,c
LogField ListField(std::string_view key, const std::vector<std::string>& items);

/*
  Settings resolve per key: environment (JOBFLOW_LOG_LEVEL,
  JOBFLOW_LOG_PATTERN, JOBFLOW_LOG_FILE, JOBFLOW_LOG_INCLUDE_TRACE_CONTEXT),
  then RuntimeConfig.logging, then defaults.
*/
struct LogSettings {
  std::string level{"info"};
  std::string pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  std::string file_path; // empty: stderr only
  bool        include_trace_context{false};
};

LogSettings ResolveLogSettings(const jobflow::runtime::config::RuntimeConfig& config);

// Safe to call more than once; later calls rebuild the logger's sinks.
void InitializeLogging(const jobflow::runtime::config::RuntimeConfig& config);
void InitializeLogging(const LogSettings& settings);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace jobflow::observability

#define JOBFLOW_LOG_DEBUG(message, ...) ::jobflow::observability::LogDebug((message), ##__VA_ARGS__)
#define JOBFLOW_LOG_INFO(message, ...) ::jobflow::observability::LogInfo((message), ##__VA_ARGS__)
#define JOBFLOW_LOG_WARN(message, ...) ::jobflow::observability::LogWarn((message), ##__VA_ARGS__)
#define JOBFLOW_LOG_ERROR(message, ...) ::jobflow::observability::LogError((message), ##__VA_ARGS__)
