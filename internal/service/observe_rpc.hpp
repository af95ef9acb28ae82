#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/policy/policy_enforcer.hpp"
#include "internal/service/service_context.hpp"

namespace ledger::service {

/*
  Wraps one service call: span, policy check, request metrics and a
  log line on failure. Exceptions propagate unchanged.
*/
template <typename Fn>
auto ObserveRpc(const ServiceContext& ctx, std::string_view route, const policy::Caller& caller, Fn&& fn) {
  observability::SpanScope span(route);
  span.SetAttribute("ledger.caller", caller.user_id);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if (ctx.policy) {
      ctx.policy->Enforce(policy::PolicyFor(route), caller);
    }

    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observability::Metrics::Instance().RecordRequest(route, true);
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      observability::Metrics::Instance().RecordRequest(route, true);
      observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LEDGER_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("user_id", caller.user_id),
                                   observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace ledger::service
