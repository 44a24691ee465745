#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace market::service {

// Rejections caused by the caller or by market rules, as opposed to faults.
inline bool IsBusinessError(const std::exception& e) {
  return dynamic_cast<const util::NotFound*>(&e) || dynamic_cast<const util::AlreadyExists*>(&e) ||
         dynamic_cast<const util::InvalidArgument*>(&e) || dynamic_cast<const util::InvalidState*>(&e) ||
         dynamic_cast<const util::NoEligibleWorkers*>(&e) || dynamic_cast<const util::InsufficientBidders*>(&e) ||
         dynamic_cast<const util::InsufficientFunds*>(&e);
}

// Span, request metrics and an error log around one service call.
// Exceptions are rethrown for the transport adapter to translate.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    observability::Metrics::Instance().RecordRequest(route, ok);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    if (IsBusinessError(ex)) {
      MARKET_LOG_WARN("RPC rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    } else {
      MARKET_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    }
    finish(false);
    throw;
  }
}

} // namespace market::service
