#pragma once
/// @file resource_sampler.hpp
/// @brief Process and host CPU/memory queries.
///
/// ResourceSampler is the seam every monitoring component reads through.
/// ProcfsSampler is the production implementation backed by /proc and
/// getrusage(); tests substitute scripted samplers.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace opscope {

/// @brief An OS/process introspection query failed.
struct SamplingError {
  std::error_code code; ///< Underlying cause.
  std::string what;     ///< Which query failed and why.
};

/// @brief Process memory usage together with host availability.
struct MemorySnapshot {
  double resident_mb = 0.0;         ///< Resident set size of this process.
  double virtual_mb = 0.0;          ///< Virtual address space of this process.
  double percent_of_system = 0.0;   ///< resident / host physical memory * 100.
  double system_available_mb = 0.0; ///< Memory the host can still hand out.
};

/// @brief Host CPU utilization over a sampling interval.
struct CpuSnapshot {
  double percent_total = 0.0;
  std::vector<double> percent_per_core;
  std::array<double, 3> load_average{}; ///< 1/5/15 min; zero if unsupported.
};

/// @brief Source of resource measurements.
///
/// Implementations must be safe to call from multiple threads.
class ResourceSampler {
public:
  using Seconds = std::chrono::duration<double>;

  virtual ~ResourceSampler() = default;

  /// @brief Current memory usage of this process.
  [[nodiscard]] virtual auto memory_snapshot() const
      -> std::expected<MemorySnapshot, SamplingError> = 0;

  /// @brief Host CPU utilization.
  ///
  /// Blocks for approximately @p interval. A zero interval compares against
  /// the previous call instead (the first such call reports 0).
  [[nodiscard]] virtual auto cpu_snapshot(Seconds interval) const
      -> std::expected<CpuSnapshot, SamplingError> = 0;

  /// @brief CPU consumed by this process since the previous call, in percent
  /// of one core. Non-blocking; the first call reports 0.
  [[nodiscard]] virtual auto process_cpu_percent() const
      -> std::expected<double, SamplingError> = 0;
};

/// @brief ResourceSampler reading /proc (Linux) and getrusage().
class ProcfsSampler final : public ResourceSampler {
public:
  ProcfsSampler() = default;

  [[nodiscard]] auto memory_snapshot() const
      -> std::expected<MemorySnapshot, SamplingError> override;

  [[nodiscard]] auto cpu_snapshot(Seconds interval) const
      -> std::expected<CpuSnapshot, SamplingError> override;

  [[nodiscard]] auto process_cpu_percent() const
      -> std::expected<double, SamplingError> override;

  /// @brief Cumulative jiffies for one "cpu" line of /proc/stat.
  struct CpuTimes {
    std::uint64_t user = 0;
    std::uint64_t nice = 0;
    std::uint64_t system = 0;
    std::uint64_t idle = 0;
    std::uint64_t iowait = 0;
    std::uint64_t irq = 0;
    std::uint64_t softirq = 0;
    std::uint64_t steal = 0;

    [[nodiscard]] auto total() const noexcept -> std::uint64_t {
      return user + nice + system + idle + iowait + irq + softirq + steal;
    }
    [[nodiscard]] auto busy() const noexcept -> std::uint64_t {
      return total() - idle - iowait;
    }
  };

  /// @brief Aggregate line first, then one entry per core.
  using CpuTable = std::vector<CpuTimes>;

private:
  // Baseline for zero-interval cpu_snapshot().
  mutable std::mutex cpu_mutex_;
  mutable CpuTable last_cpu_table_;

  // Baseline for process_cpu_percent().
  mutable std::mutex process_mutex_;
  mutable bool process_primed_ = false;
  mutable std::chrono::microseconds last_process_cpu_{0};
  mutable std::chrono::steady_clock::time_point last_process_wall_{};
};

/// @brief Percent busy between two /proc/stat readings of the same CPU.
[[nodiscard]] auto busy_percent(const ProcfsSampler::CpuTimes &before,
                                const ProcfsSampler::CpuTimes &after) noexcept
    -> double;

/// @brief Suggested worker count: min(logical cores, physical cores * 2).
[[nodiscard]] auto optimal_thread_count() -> std::size_t;

} // namespace opscope
