#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace strands::service {

/*
  Wraps one RPC body in a span and records per-route count and latency.
  Failures are logged with route, caller, reason and latency, then
  rethrown for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, uint64_t caller_id, Fn&& fn) {
  strands::observability::SpanScope span(route);
  span.SetAttribute("caller.id", static_cast<std::int64_t>(caller_id));

  auto&      metrics    = strands::observability::Metrics::Instance();
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
    const double latency_ms = elapsed_ms();
    const auto*  domain     = dynamic_cast<const strands::util::Error*>(&ex);
    const auto   reason     = domain ? strands::util::ToString(domain->Reason()) : std::string_view("INTERNAL");

    span.SetAttribute("reject.reason", reason);
    span.RecordException(ex.what());
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, latency_ms);

    if (domain) {
      STRANDS_LOG_WARN("RPC rejected", {strands::observability::StringField("route", route),
                                        strands::observability::UIntField("caller_id", caller_id),
                                        strands::observability::StringField("reason", reason),
                                        strands::observability::StringField("error", ex.what()),
                                        strands::observability::IntField("latency_ms", static_cast<int64_t>(latency_ms))});
    } else {
      STRANDS_LOG_ERROR("RPC failed", {strands::observability::StringField("route", route),
                                       strands::observability::UIntField("caller_id", caller_id),
                                       strands::observability::StringField("reason", reason),
                                       strands::observability::StringField("error", ex.what()),
                                       strands::observability::IntField("latency_ms", static_cast<int64_t>(latency_ms))});
    }
    throw;
  }
}

inline void RequireCaller(uint64_t caller_id) {
  if (caller_id == 0) {
    throw strands::util::Unauthenticated("Unauthorized");
  }
}

} // namespace strands::service
