#pragma once
/// @file operation.hpp
/// @brief The callable-operation type every wrapper consumes and produces.

#include <chrono>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace opscope {

/// @brief A wrappable operation. Every wrapper takes one and returns one of
/// the same shape, so layers compose by plain nesting:
/// @code
///   auto op = cache.wrap("lookup", guard.wrap("lookup", batched));
/// @endcode
template <typename Sig> using Operation = std::function<Sig>;

namespace detail {

/// @brief Invoke @p op, then report its wall-clock latency to @p done.
///
/// @p done receives (seconds, succeeded) exactly once, on the success path
/// and when @p op throws. Exceptions from @p op propagate unchanged.
template <typename Done, typename F, typename... Args>
auto timed_invoke(Done &&done, F &op, Args &&...args)
    -> std::invoke_result_t<F &, Args...> {
  using Clock = std::chrono::steady_clock;
  using R = std::invoke_result_t<F &, Args...>;

  const auto t0 = Clock::now();
  const auto elapsed = [t0] {
    return std::chrono::duration<double>(Clock::now() - t0).count();
  };

  if constexpr (std::is_void_v<R>) {
    try {
      std::invoke(op, std::forward<Args>(args)...);
    } catch (...) {
      done(elapsed(), false);
      throw;
    }
    done(elapsed(), true);
  } else {
    std::optional<R> result;
    try {
      result.emplace(std::invoke(op, std::forward<Args>(args)...));
    } catch (...) {
      done(elapsed(), false);
      throw;
    }
    done(elapsed(), true);
    return std::move(*result);
  }
}

} // namespace detail

} // namespace opscope
