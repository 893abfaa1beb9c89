#pragma once
/// @file instrumented_cache.hpp
/// @brief Capacity- and TTL-bounded memoizing wrapper that reports hits and
///        misses to a MetricsRegistry.
///
/// Eviction is by insertion time: when the table is full, the entry with the
/// smallest insertion timestamp goes, however recently it was read.
///
/// The table lock covers only table metadata. A miss marks its key in flight,
/// runs the operation unlocked, then inserts. Concurrent callers with other
/// keys proceed in parallel; callers with the same key wait for the marker
/// and re-check the table, so each key is computed at most once at a time.

#include "cache/cache_info.hpp"
#include "cache/cache_key.hpp"
#include "interface/operation.hpp"
#include "metrics/metrics_registry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace opscope {

template <typename Sig, typename Clock = std::chrono::steady_clock>
class InstrumentedCache;

template <typename Result, typename... Args, typename Clock>
class InstrumentedCache<Result(Args...), Clock> {
  static_assert(!std::is_void_v<Result>, "cannot memoize a void operation");
  static_assert(std::is_copy_constructible_v<Result>,
                "cached results are handed out by copy");

public:
  using TimePoint = typename Clock::time_point;
  using Function = Operation<Result(Args...)>;

  /// @param registry Receives hit/miss counts and miss latencies. Must
  ///                 outlive every operation returned by wrap().
  /// @param cfg      Table bounds.
  /// @throws std::invalid_argument if cfg.capacity is 0.
  InstrumentedCache(MetricsRegistry &registry, CacheConfig cfg)
      : state_{std::make_shared<State>(registry, validated(cfg))} {}

  /// @brief Bind @p op to this cache's table.
  ///
  /// The returned operation shares the table with this object and stays
  /// valid after the cache object is destroyed.
  /// @throws std::logic_error if an operation is already bound.
  auto wrap(std::string name, Function op) -> Function {
    {
      std::lock_guard lock(state_->mutex);
      if (state_->op) {
        throw std::logic_error{"cache already wraps operation '" +
                               state_->name + "'"};
      }
      state_->name = std::move(name);
      state_->op = std::move(op);
    }
    return [state = state_](Args... args) -> Result {
      return call(*state, std::forward<Args>(args)...);
    };
  }

  /// @brief Remove every entry.
  void clear() {
    std::lock_guard lock(state_->mutex);
    state_->table.clear();
    state_->by_insertion.clear();
  }

  [[nodiscard]] auto info() const -> CacheInfo {
    std::size_t size = 0;
    std::string name;
    {
      std::lock_guard lock(state_->mutex);
      size = state_->table.size();
      name = state_->name;
    }
    const auto [hits, misses] = state_->registry.cache_counters(name);
    return CacheInfo{
        .size = size,
        .capacity = state_->config.capacity,
        .ttl = state_->config.ttl,
        .hits = hits,
        .misses = misses,
    };
  }

  /// @brief Current keys, oldest insertion first.
  [[nodiscard]] auto keys() const -> std::vector<std::string> {
    std::lock_guard lock(state_->mutex);
    std::vector<std::string> out;
    out.reserve(state_->by_insertion.size());
    for (const auto &[order, key] : state_->by_insertion) {
      out.push_back(key);
    }
    return out;
  }

  /// @brief Insertion timestamp of @p key, if present (expired or not).
  [[nodiscard]] auto inserted_at(const std::string &key) const
      -> std::optional<TimePoint> {
    std::lock_guard lock(state_->mutex);
    auto it = state_->table.find(key);
    if (it == state_->table.end()) {
      return std::nullopt;
    }
    return it->second.inserted_at;
  }

  /// @brief The key a call with @p args would use.
  [[nodiscard]] static auto key_for(const std::remove_cvref_t<Args> &...args)
      -> std::string {
    return derive_key(args...);
  }

private:
  // Orders entries by insertion time; the sequence breaks timestamp ties.
  using InsertionOrder = std::pair<TimePoint, std::uint64_t>;

  struct Entry {
    Result value;
    TimePoint inserted_at;
    std::uint64_t sequence;
  };

  struct State {
    State(MetricsRegistry &r, CacheConfig c) : registry{r}, config{c} {}

    MetricsRegistry &registry;
    const CacheConfig config;
    std::string name;
    Function op;

    std::mutex mutex;
    std::unordered_map<std::string, Entry> table;
    std::map<InsertionOrder, std::string> by_insertion;
    std::unordered_map<std::string, std::shared_future<void>> in_flight;
    std::uint64_t next_sequence = 0;

    [[nodiscard]] auto is_live(const Entry &e, TimePoint now) const -> bool {
      return !config.ttl || (now - e.inserted_at) < *config.ttl;
    }

    void erase(typename std::unordered_map<std::string, Entry>::iterator it) {
      by_insertion.erase(InsertionOrder{it->second.inserted_at,
                                        it->second.sequence});
      table.erase(it);
    }

    void insert(const std::string &key, const Result &value, TimePoint now) {
      if (auto it = table.find(key); it != table.end()) {
        erase(it);
      }
      if (table.size() >= config.capacity && !by_insertion.empty()) {
        auto oldest = by_insertion.begin();
        table.erase(oldest->second);
        by_insertion.erase(oldest);
      }
      const auto seq = next_sequence++;
      by_insertion.emplace(InsertionOrder{now, seq}, key);
      table.emplace(key, Entry{value, now, seq});
    }
  };

  /// Clears the in-flight marker and wakes waiters, on success or failure.
  class InFlightRelease {
  public:
    InFlightRelease(State &state, const std::string &key,
                    std::promise<void> &done) noexcept
        : state_{state}, key_{key}, done_{done} {}
    InFlightRelease(const InFlightRelease &) = delete;
    InFlightRelease &operator=(const InFlightRelease &) = delete;

    ~InFlightRelease() {
      {
        std::lock_guard lock(state_.mutex);
        state_.in_flight.erase(key_);
      }
      done_.set_value();
    }

  private:
    State &state_;
    const std::string &key_;
    std::promise<void> &done_;
  };

  static auto validated(CacheConfig cfg) -> CacheConfig {
    if (cfg.capacity == 0) {
      throw std::invalid_argument{"cache capacity must be positive"};
    }
    return cfg;
  }

  static auto call(State &state, Args... args) -> Result {
    // Fails fast, before any counter moves or the operation runs.
    const auto key = derive_key(args...);

    std::promise<void> done;
    for (;;) {
      std::shared_future<void> pending;
      {
        std::lock_guard lock(state.mutex);
        if (auto it = state.table.find(key); it != state.table.end()) {
          if (state.is_live(it->second, Clock::now())) {
            state.registry.record_cache_hit(state.name);
            return it->second.value;
          }
          state.erase(it);
        }

        if (auto it = state.in_flight.find(key); it != state.in_flight.end()) {
          pending = it->second;
        } else {
          state.registry.record_cache_miss(state.name);
          state.in_flight.emplace(key, done.get_future().share());
          break;
        }
      }
      // Same key is being computed elsewhere; look again once it settles.
      pending.wait();
    }

    InFlightRelease release{state, key, done};
    auto result = detail::timed_invoke(
        [&state](double seconds, bool) {
          state.registry.record(state.name, seconds);
        },
        state.op, std::forward<Args>(args)...);

    {
      std::lock_guard lock(state.mutex);
      state.insert(key, result, Clock::now());
    }
    return result;
  }

  std::shared_ptr<State> state_;
};

} // namespace opscope
