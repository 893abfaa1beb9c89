#pragma once
/// @file metric_sample.hpp
/// @brief Per-call samples and the aggregates derived from them.

#include <cstdint>
#include <map>
#include <string>

namespace opscope {

/// @brief Resource usage and latency of one recorded call. Immutable.
struct MetricSample {
  double cpu_percent = 0.0;    ///< Process CPU, percent of one core.
  double memory_percent = 0.0; ///< Resident memory, percent of host memory.
  double memory_mb = 0.0;      ///< Resident memory in MB.
  double execution_time_s = 0.0;
  std::uint64_t call_index = 0;   ///< Operation call counter at recording.
  std::uint64_t cache_hits = 0;   ///< Hit counter at recording.
  std::uint64_t cache_misses = 0; ///< Miss counter at recording.
};

/// @brief Arithmetic means over an operation's stored samples, paired with
/// the latest counter values.
struct AverageMetrics {
  double cpu_percent = 0.0;
  double memory_percent = 0.0;
  double memory_mb = 0.0;
  double execution_time_s = 0.0;
  std::uint64_t call_count = 0;
  std::uint64_t cache_hits = 0;
  std::uint64_t cache_misses = 0;
};

/// @brief Reporting view of one operation. Averages rounded to 2 decimals.
struct OperationReport {
  double avg_cpu_percent = 0.0;
  double avg_memory_mb = 0.0;
  double avg_execution_time_ms = 0.0;
  std::uint64_t total_calls = 0;
  double cache_hit_rate_percent = 0.0;
  std::uint64_t total_cache_hits = 0;
  std::uint64_t total_cache_misses = 0;
};

/// @brief Operation name → report, ordered by name.
using MetricsReport = std::map<std::string, OperationReport>;

/// @brief hits / (hits + misses) * 100, or 0 when nothing was looked up.
[[nodiscard]] constexpr auto hit_rate_percent(std::uint64_t hits,
                                              std::uint64_t misses) noexcept
    -> double {
  const auto lookups = hits + misses;
  return lookups > 0
             ? static_cast<double>(hits) / static_cast<double>(lookups) * 100.0
             : 0.0;
}

} // namespace opscope
