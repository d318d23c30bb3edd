#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace jobflow::observability {
namespace {

constexpr const char* kLoggerName = "jobflow";
constexpr size_t      kMaxLoggedIds = 16;

bool g_include_trace_context{false};

// Environment first, then the config value, then the fallback.
std::string Pick(const char* env_name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(env_name)) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

#ifdef ENABLE_OTEL
std::string Hex(const uint8_t* data, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

// " trace_id=... span_id=..." for the active span, empty otherwise.
std::string TraceSuffix() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid()) return {};

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return " trace_id=" + Hex(trace_bytes, sizeof(trace_bytes)) + " span_id=" + Hex(span_bytes, sizeof(span_bytes));
}
#else
std::string TraceSuffix() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField IdsField(std::string_view key, const std::vector<std::uint64_t>& ids) {
  std::string out = "[";
  for (size_t i = 0; i < ids.size() && i < kMaxLoggedIds; ++i) {
    if (i) out += ',';
    out += std::to_string(ids[i]);
  }
  if (ids.size() > kMaxLoggedIds) out += ",...+" + std::to_string(ids.size() - kMaxLoggedIds);
  out += ']';
  return {std::string(key), std::move(out)};
}

LogField ListField(std::string_view key, const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ',';
    out += item;
  }
  return {std::string(key), std::move(out)};
}

LogSettings ResolveLogSettings(const jobflow::runtime::config::RuntimeConfig& config) {
  const auto& logging  = config.logging();
  const LogSettings defaults;

  LogSettings settings;
  settings.level     = Pick("JOBFLOW_LOG_LEVEL", logging.level(), defaults.level);
  settings.pattern   = Pick("JOBFLOW_LOG_PATTERN", logging.pattern(), defaults.pattern);
  settings.file_path = Pick("JOBFLOW_LOG_FILE", logging.file_path(), defaults.file_path);

  if (const char* include_trace = std::getenv("JOBFLOW_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

void InitializeLogging(const jobflow::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void InitializeLogging(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!settings.file_path.empty()) {
    // the workflow's log accumulates across sessions
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file_path, false));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
  line += TraceSuffix();

  spdlog::log(level, "{}", line);
}

} // namespace jobflow::observability
