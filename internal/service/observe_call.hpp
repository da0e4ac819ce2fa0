#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace trailmap::service {

/*
  Runs one public service call inside a span, records request metrics and
  logs the failure kind before rethrowing. Business rejections log at warn,
  anything else at error.
*/
template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view task_id, Fn&& fn) {
  trailmap::observability::SpanScope span(route);
  if (!task_id.empty()) {
    span.SetAttribute("trailmap.task_id", task_id);
  }

  auto& metrics    = trailmap::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    const auto kind = trailmap::util::KindOf(ex);

    if (kind == trailmap::util::ErrorKind::kInternal) {
      span.RecordError(ex.what());
      TRAILMAP_LOG_ERROR("Request failed", {trailmap::observability::StringField("route", route),
                                            trailmap::observability::StringField("task_id", task_id),
                                            trailmap::observability::StringField("error", ex.what())});
    } else {
      span.RecordRejection(trailmap::util::ToString(kind));
      metrics.RecordRejection(trailmap::util::ToString(kind));
      TRAILMAP_LOG_WARN("Request rejected", {trailmap::observability::StringField("route", route),
                                             trailmap::observability::StringField("task_id", task_id),
                                             trailmap::observability::StringField("kind", trailmap::util::ToString(kind)),
                                             trailmap::observability::StringField("error", ex.what())});
    }
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace trailmap::service
