#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace trailmap::runtime::config {
class RuntimeConfig;
}

namespace trailmap::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"trailmap"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

#ifdef TRAILMAP_ENABLE_OTEL
OtlpConfig OtlpConfigFrom(const trailmap::runtime::config::RuntimeConfig& config);

// configured endpoint, or the local collector default; signal is "traces" or "metrics"
std::string OtlpEndpoint(const OtlpConfig& config, std::string_view signal);
#endif

bool InitializeTracing(const trailmap::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const trailmap::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per engine call, named after its route.
class SpanScope {
 public:
  explicit SpanScope(std::string_view route);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);

  // business rejection: tagged, the span status stays ok
  void RecordRejection(std::string_view kind);
  void RecordError(std::string_view description);

 private:
#ifdef TRAILMAP_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // engine rejections by kind ("CycleDetected", "InvalidTransition", ...)
  void RecordRejection(std::string_view kind);

 private:
  Metrics();
#ifdef TRAILMAP_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef TRAILMAP_ENABLE_OTEL
inline bool InitializeTracing(const trailmap::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const trailmap::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordRejection(std::string_view) {
}

inline void SpanScope::RecordError(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRejection(std::string_view) {
}
#endif

} // namespace trailmap::observability
