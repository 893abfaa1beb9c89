#pragma once
/// @file threshold_guard.hpp
/// @brief Observes resource usage around a wrapped call without enforcing
///        anything.

#include "interface/operation.hpp"
#include "observe/observation.hpp"
#include "sampler/resource_sampler.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace opscope {

/// @brief Thresholds checked by a ThresholdGuard.
struct GuardConfig {
  double memory_threshold_mb = 500.0;       ///< Resident MB before the call.
  double cpu_threshold_percent = 80.0;      ///< Host CPU before the call.
  double memory_growth_threshold_mb = 50.0; ///< Resident growth during it.
  /// Interval cpu_snapshot() blocks for on every guarded call.
  std::chrono::duration<double> cpu_sample_interval{1.0};
};

/// @brief Emits observations when a call starts under memory or CPU pressure
/// or grows resident memory sharply.
///
/// Purely observational: the wrapped call always runs, its result or
/// exception is returned unchanged, and sampling failures become
/// SamplingFailed observations instead of errors.
class ThresholdGuard {
public:
  /// @param sampler Must outlive the guard and every operation it wraps.
  /// @param cfg     Thresholds.
  /// @param sink    Receives observations; logs through spdlog by default.
  explicit ThresholdGuard(const ResourceSampler &sampler, GuardConfig cfg = {},
                          ObservationSink sink = log_sink());

  /// @brief Wrap @p op with pre/post resource observation.
  template <typename Result, typename... Args>
  auto wrap(std::string name, Operation<Result(Args...)> op) const
      -> Operation<Result(Args...)> {
    return [guard = *this, name = std::move(name),
            op = std::move(op)](Args... args) -> Result {
      const auto baseline = guard.before_call(name);
      if constexpr (std::is_void_v<Result>) {
        std::invoke(op, std::forward<Args>(args)...);
        guard.after_call(name, baseline);
      } else {
        Result result = std::invoke(op, std::forward<Args>(args)...);
        guard.after_call(name, baseline);
        return result;
      }
    };
  }

  /// @brief Pre-call checks.
  /// @return Resident MB to compare against after the call, if sampled.
  auto before_call(std::string_view operation) const -> std::optional<double>;

  /// @brief Post-call growth check against @p baseline_mb.
  void after_call(std::string_view operation,
                  std::optional<double> baseline_mb) const;

  [[nodiscard]] auto config() const noexcept -> const GuardConfig & {
    return cfg_;
  }

private:
  void emit(Observation obs) const;

  const ResourceSampler *sampler_;
  GuardConfig cfg_;
  ObservationSink sink_;
};

} // namespace opscope
