#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace brewmon::service {

/*
  Span, request counter and latency histogram around one RPC body.
  Exceptions are logged and rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  brewmon::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    brewmon::observability::Metrics::Instance().RecordRequest(route, success);
    brewmon::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    BREWMON_LOG_ERROR("RPC failed", {brewmon::observability::StringField("route", route), brewmon::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace brewmon::service
