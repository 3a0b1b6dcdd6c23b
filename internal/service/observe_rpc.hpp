#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace recall::service {

/*
  Wraps one service call in a span, request count/latency metrics and
  failure logging. Exceptions are rethrown unchanged for the transport
  layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& user_id, Fn&& fn) {
  recall::observability::SpanScope span(route);
  span.SetAttribute("user.id", user_id);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      recall::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return;
    } else {
      auto result = fn();
      recall::observability::Metrics::Instance().RecordRpc(route, true, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RECALL_LOG_ERROR("RPC failed", {recall::observability::StringField("route", route), recall::observability::StringField("error", ex.what()),
                                    recall::observability::StringField("user_id", user_id)});
    recall::observability::Metrics::Instance().RecordRpc(route, false, elapsed_ms());
    throw;
  }
}

} // namespace recall::service
