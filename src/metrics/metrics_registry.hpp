#pragma once
/// @file metrics_registry.hpp
/// @brief Thread-safe store of per-operation samples and cache counters.

#include "metrics/metric_sample.hpp"
#include "sampler/resource_sampler.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace opscope {

/// @brief Aggregates latency and resource samples per operation name.
///
/// Every operation is serialized by one mutex, so readers always see a
/// complete sample window. Resource sampling happens before the lock is
/// taken; a failed sample is logged and dropped, never thrown.
class MetricsRegistry {
public:
  /// Samples retained per operation; older samples are dropped first.
  static constexpr std::size_t kMaxSamples = 100;

  /// @param sampler Source of the resource snapshot attached to each sample.
  ///                Must outlive the registry.
  explicit MetricsRegistry(const ResourceSampler &sampler) noexcept;

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  /// @brief Record one completed call of @p operation.
  ///
  /// Takes a resource snapshot, stamps it with the operation's next call index
  /// and current hit/miss counters, and appends it. Sampling failures are
  /// logged at warn level; the call is then not recorded.
  void record(std::string_view operation, double execution_time_s);

  void record_cache_hit(std::string_view operation);
  void record_cache_miss(std::string_view operation);

  /// @brief Means over the stored samples, or nullopt without samples.
  [[nodiscard]] auto average(std::string_view operation) const
      -> std::optional<AverageMetrics>;

  /// @brief Rounded per-operation statistics for every operation that has at
  /// least one sample.
  [[nodiscard]] auto report() const -> MetricsReport;

  /// @brief Copy of the stored sample window, oldest first.
  [[nodiscard]] auto samples(std::string_view operation) const
      -> std::vector<MetricSample>;

  /// @brief Current hit and miss counters.
  [[nodiscard]] auto cache_counters(std::string_view operation) const
      -> std::pair<std::uint64_t, std::uint64_t>;

  /// @brief Names of every operation seen so far, sorted.
  [[nodiscard]] auto operations() const -> std::vector<std::string>;

  /// @brief Drop all samples and counters.
  void clear();

private:
  struct OperationStats {
    std::deque<MetricSample> samples;
    std::uint64_t call_counter = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;
  };

  // Transparent lookup so string_view callers do not allocate on reads.
  struct NameHash {
    using is_transparent = void;
    auto operator()(std::string_view s) const noexcept -> std::size_t {
      return std::hash<std::string_view>{}(s);
    }
  };
  using StatsMap = std::unordered_map<std::string, OperationStats, NameHash,
                                      std::equal_to<>>;

  auto stats_for(std::string_view operation) -> OperationStats &;
  [[nodiscard]] auto find(std::string_view operation) const
      -> const OperationStats *;
  [[nodiscard]] static auto average_of(const OperationStats &stats)
      -> std::optional<AverageMetrics>;

  const ResourceSampler &sampler_;
  mutable std::mutex mutex_;
  StatsMap stats_;
};

} // namespace opscope
