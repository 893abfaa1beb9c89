#pragma once
/// @file timed_operation.hpp
/// @brief Wrapper that records the latency of every call.

#include "interface/operation.hpp"
#include "metrics/metrics_registry.hpp"

#include <string>
#include <utility>

namespace opscope {

/// @brief Wrap @p op so each call, successful or not, is recorded in
/// @p registry under @p name. The registry must outlive the returned
/// operation.
template <typename Result, typename... Args>
auto wrap_with_timing(MetricsRegistry &registry, std::string name,
                      Operation<Result(Args...)> op)
    -> Operation<Result(Args...)> {
  return [&registry, name = std::move(name),
          op = std::move(op)](Args... args) -> Result {
    return detail::timed_invoke(
        [&](double seconds, bool) { registry.record(name, seconds); }, op,
        std::forward<Args>(args)...);
  };
}

} // namespace opscope
