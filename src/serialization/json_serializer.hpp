#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for samples, snapshots and reports.

#include "cache/cache_info.hpp"
#include "metrics/metric_sample.hpp"
#include "sampler/resource_sampler.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <system_error>

namespace opscope {

inline void to_json(nlohmann::json &j, const MetricSample &s) {
  j = nlohmann::json{
      {"cpu_percent", s.cpu_percent},
      {"memory_percent", s.memory_percent},
      {"memory_mb", s.memory_mb},
      {"execution_time_s", s.execution_time_s},
      {"call_index", s.call_index},
      {"cache_hits", s.cache_hits},
      {"cache_misses", s.cache_misses},
  };
}

inline void to_json(nlohmann::json &j, const OperationReport &r) {
  j = nlohmann::json{
      {"avg_cpu_percent", r.avg_cpu_percent},
      {"avg_memory_mb", r.avg_memory_mb},
      {"avg_execution_time_ms", r.avg_execution_time_ms},
      {"total_calls", r.total_calls},
      {"cache_hit_rate_percent", r.cache_hit_rate_percent},
      {"total_cache_hits", r.total_cache_hits},
      {"total_cache_misses", r.total_cache_misses},
  };
}

inline void to_json(nlohmann::json &j, const MemorySnapshot &m) {
  j = nlohmann::json{
      {"rss_mb", m.resident_mb},
      {"vms_mb", m.virtual_mb},
      {"percent", m.percent_of_system},
      {"available_mb", m.system_available_mb},
  };
}

inline void to_json(nlohmann::json &j, const CpuSnapshot &c) {
  j = nlohmann::json{
      {"percent", c.percent_total},
      {"per_cpu", c.percent_per_core},
      {"load_avg", c.load_average},
  };
}

inline void to_json(nlohmann::json &j, const CacheInfo &i) {
  j = nlohmann::json{
      {"size", i.size},
      {"maxsize", i.capacity},
      {"hits", i.hits},
      {"misses", i.misses},
  };
  if (i.ttl) {
    j["ttl"] = std::chrono::duration<double>(*i.ttl).count();
  } else {
    j["ttl"] = nullptr;
  }
}

/// @brief Operation name → report object.
[[nodiscard]] inline auto report_to_json(const MetricsReport &report)
    -> nlohmann::json {
  auto j = nlohmann::json::object();
  for (const auto &[name, op] : report) {
    j[name] = op;
  }
  return j;
}

/// @brief Write @p report with an export timestamp to @p path as indented
/// JSON, creating parent directories.
[[nodiscard]] auto export_report(const MetricsReport &report,
                                 const std::filesystem::path &path)
    -> std::expected<void, std::error_code>;

} // namespace opscope
