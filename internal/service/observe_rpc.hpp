#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace audit::service {

/*
  Runs fn inside a span, records request count and latency for route and
  logs failures before rethrowing them to the transport layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view request_id, Fn&& fn) {
  audit::observability::SpanScope span(route);
  span.SetAttribute("request.id", request_id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    audit::observability::Metrics::Instance().RecordRequest(route, success);
    audit::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AUDIT_LOG_ERROR("RPC failed", {audit::observability::StringField("route", route),
                                   audit::observability::StringField("request_id", request_id),
                                   audit::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace audit::service
