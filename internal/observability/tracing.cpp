#include "internal/observability/spans.hpp"

#ifdef TRAILMAP_ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"

namespace trailmap::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "trailmap";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string BackendName(const trailmap::runtime::config::DatabaseConfig& database) {
  switch (database.backend_case()) {
    case trailmap::runtime::config::DatabaseConfig::kSqlite:
      return "sqlite";
    case trailmap::runtime::config::DatabaseConfig::kPostgres:
      return "postgres";
    default:
      return "memory";
  }
}

} // namespace

OtlpConfig OtlpConfigFrom(const trailmap::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == trailmap::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }
  return otlp_config;
}

std::string OtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (config.endpoint.empty()) {
    if (config.transport == OtlpTransport::kGrpc) return "localhost:4317";
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  // one configured collector serves both signals; http needs the per-signal path
  if (config.transport == OtlpTransport::kHttpProtobuf && config.endpoint.find("/v1/") == std::string::npos) {
    auto base = config.endpoint;
    if (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/v1/" + std::string(signal);
  }
  return config.endpoint;
}

bool InitializeTracing(const trailmap::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);
  const auto endpoint    = OtlpEndpoint(otlp_config, "traces");

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}, {"trailmap.backend", BackendName(config.database())}};
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

// Without InitializeTracing the global provider is the no-op one and spans cost nothing.
SpanScope::SpanScope(std::string_view route) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracer ? g_tracer : trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName, kTracerVersion);

  impl_->span  = tracer->StartSpan(std::string(route));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  impl_->span->SetAttribute("trailmap.route", std::string(route));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordRejection(std::string_view kind) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute("trailmap.rejection", std::string(kind));
  }
}

void SpanScope::RecordError(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace trailmap::observability

#endif
