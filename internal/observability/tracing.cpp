#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

namespace jobflow::observability {

TracingOptions TracingOptionsFrom(const jobflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  TracingOptions options;
  options.enabled   = observability.tracing_enabled();
  options.endpoint  = observability.otlp_endpoint();
  options.transport = observability.transport() == jobflow::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                  : OtlpTransport::kGrpc;
  return options;
}

} // namespace jobflow::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

namespace jobflow::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kInstrumentationName    = "jobflow.store";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string Endpoint(const TracingOptions& options) {
  if (!options.endpoint.empty()) return options.endpoint;

  for (const char* env : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(env)) return value;
  }

  return options.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingOptions& options) {
  if (options.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions http;
    http.url = Endpoint(options);
    return otlp::OtlpHttpExporterFactory::Create(http);
  }

  otlp::OtlpGrpcExporterOptions grpc;
  grpc.endpoint = Endpoint(options);
  return otlp::OtlpGrpcExporterFactory::Create(grpc);
}

trace_api::Tracer* Tracer() {
  if (!g_tracer) {
    // spans opened before InitializeTracing go to whatever provider is global
    if (auto provider = trace_api::Provider::GetTracerProvider()) g_tracer = provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }
  return g_tracer.get();
}

} // namespace

bool InitializeTracing(const TracingOptions& options) {
  if (!options.enabled) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(options), sdktrace::BatchSpanProcessorOptions{});
  auto resource  = opentelemetry::sdk::resource::Resource::Create({{"service.name", options.service_name}});

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const jobflow::runtime::config::RuntimeConfig& config) {
  return InitializeTracing(TracingOptionsFrom(config));
}

void ShutdownTracing() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name, std::initializer_list<LogField> attributes) : impl_(std::make_unique<Impl>()) {
  auto* tracer = Tracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(impl_->span);
  for (const auto& field : attributes) impl_->span->SetAttribute(field.key, field.value);
}

SpanScope::~SpanScope() {
  if (impl_->span) impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_->span) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace jobflow::observability

#endif
