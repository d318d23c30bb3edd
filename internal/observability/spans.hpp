#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace jobflow::runtime::config {
class RuntimeConfig;
}

namespace jobflow::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct TracingOptions {
  bool          enabled{false};
  std::string   service_name{"jobflow"};
  std::string   endpoint{}; // empty: OTEL_EXPORTER_OTLP_* env, then the transport default
  OtlpTransport transport{OtlpTransport::kGrpc};
};

TracingOptions TracingOptionsFrom(const jobflow::runtime::config::RuntimeConfig& config);

// Returns false when tracing is disabled or not compiled in.
bool InitializeTracing(const TracingOptions& options);
bool InitializeTracing(const jobflow::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Active span for the lifetime of the scope. Attributes take the same
  key/value fields as log lines so a commit group is described the same
  way in both. Without ENABLE_OTEL every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, std::initializer_list<LogField> attributes = {});
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const TracingOptions&) {
  return false;
}

inline bool InitializeTracing(const jobflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, std::initializer_list<LogField>) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace jobflow::observability
