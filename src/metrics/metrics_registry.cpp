/// @file metrics_registry.cpp
/// @brief Implementation of MetricsRegistry.

#include "metrics/metrics_registry.hpp"
#include "observe/observation.hpp"

#include <algorithm>
#include <cmath>

namespace opscope {

namespace {

auto round2(double v) -> double { return std::round(v * 100.0) / 100.0; }

} // namespace

MetricsRegistry::MetricsRegistry(const ResourceSampler &sampler) noexcept
    : sampler_{sampler} {}

auto MetricsRegistry::stats_for(std::string_view operation)
    -> OperationStats & {
  auto it = stats_.find(operation);
  if (it == stats_.end()) {
    it = stats_.emplace(std::string{operation}, OperationStats{}).first;
  }
  return it->second;
}

auto MetricsRegistry::find(std::string_view operation) const
    -> const OperationStats * {
  auto it = stats_.find(operation);
  return it == stats_.end() ? nullptr : &it->second;
}

void MetricsRegistry::record(std::string_view operation,
                             double execution_time_s) {
  // Snapshot outside the lock: /proc reads must not serialize callers.
  auto cpu = sampler_.process_cpu_percent();
  if (!cpu) {
    logger()->warn("Failed to record metrics for {}: {}", operation,
                   cpu.error().what);
    return;
  }
  auto memory = sampler_.memory_snapshot();
  if (!memory) {
    logger()->warn("Failed to record metrics for {}: {}", operation,
                   memory.error().what);
    return;
  }

  std::lock_guard lock(mutex_);
  auto &stats = stats_for(operation);
  ++stats.call_counter;
  stats.samples.push_back(MetricSample{
      .cpu_percent = *cpu,
      .memory_percent = memory->percent_of_system,
      .memory_mb = memory->resident_mb,
      .execution_time_s = execution_time_s,
      .call_index = stats.call_counter,
      .cache_hits = stats.cache_hits,
      .cache_misses = stats.cache_misses,
  });
  while (stats.samples.size() > kMaxSamples) {
    stats.samples.pop_front();
  }
}

void MetricsRegistry::record_cache_hit(std::string_view operation) {
  std::lock_guard lock(mutex_);
  ++stats_for(operation).cache_hits;
}

void MetricsRegistry::record_cache_miss(std::string_view operation) {
  std::lock_guard lock(mutex_);
  ++stats_for(operation).cache_misses;
}

auto MetricsRegistry::average_of(const OperationStats &stats)
    -> std::optional<AverageMetrics> {
  if (stats.samples.empty()) {
    return std::nullopt;
  }

  AverageMetrics avg;
  for (const auto &s : stats.samples) {
    avg.cpu_percent += s.cpu_percent;
    avg.memory_percent += s.memory_percent;
    avg.memory_mb += s.memory_mb;
    avg.execution_time_s += s.execution_time_s;
  }
  const auto n = static_cast<double>(stats.samples.size());
  avg.cpu_percent /= n;
  avg.memory_percent /= n;
  avg.memory_mb /= n;
  avg.execution_time_s /= n;

  const auto &latest = stats.samples.back();
  avg.call_count = latest.call_index;
  avg.cache_hits = latest.cache_hits;
  avg.cache_misses = latest.cache_misses;
  return avg;
}

auto MetricsRegistry::average(std::string_view operation) const
    -> std::optional<AverageMetrics> {
  std::lock_guard lock(mutex_);
  const auto *stats = find(operation);
  return stats ? average_of(*stats) : std::nullopt;
}

auto MetricsRegistry::report() const -> MetricsReport {
  MetricsReport report;
  std::lock_guard lock(mutex_);
  for (const auto &[name, stats] : stats_) {
    auto avg = average_of(stats);
    if (!avg) {
      continue;
    }
    // Hit/miss totals come from the live counters, not the last sample.
    report.emplace(
        name,
        OperationReport{
            .avg_cpu_percent = round2(avg->cpu_percent),
            .avg_memory_mb = round2(avg->memory_mb),
            .avg_execution_time_ms = round2(avg->execution_time_s * 1000.0),
            .total_calls = avg->call_count,
            .cache_hit_rate_percent =
                round2(hit_rate_percent(stats.cache_hits, stats.cache_misses)),
            .total_cache_hits = stats.cache_hits,
            .total_cache_misses = stats.cache_misses,
        });
  }
  return report;
}

auto MetricsRegistry::samples(std::string_view operation) const
    -> std::vector<MetricSample> {
  std::lock_guard lock(mutex_);
  const auto *stats = find(operation);
  if (stats == nullptr) {
    return {};
  }
  return {stats->samples.begin(), stats->samples.end()};
}

auto MetricsRegistry::cache_counters(std::string_view operation) const
    -> std::pair<std::uint64_t, std::uint64_t> {
  std::lock_guard lock(mutex_);
  const auto *stats = find(operation);
  if (stats == nullptr) {
    return {0, 0};
  }
  return {stats->cache_hits, stats->cache_misses};
}

auto MetricsRegistry::operations() const -> std::vector<std::string> {
  std::vector<std::string> names;
  {
    std::lock_guard lock(mutex_);
    names.reserve(stats_.size());
    for (const auto &[name, stats] : stats_) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

void MetricsRegistry::clear() {
  std::lock_guard lock(mutex_);
  stats_.clear();
}

} // namespace opscope
