/// @file resource_sampler.cpp
/// @brief /proc and getrusage() backed resource sampling.

#include "sampler/resource_sampler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

#include <sys/resource.h>
#include <unistd.h>

namespace opscope {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

auto open_failure(const char *path) -> SamplingError {
  return SamplingError{
      .code = std::make_error_code(std::errc::no_such_file_or_directory),
      .what = std::string{"cannot open "} + path,
  };
}

auto parse_failure(const char *path) -> SamplingError {
  return SamplingError{
      .code = std::make_error_code(std::errc::bad_message),
      .what = std::string{"unexpected contents in "} + path,
  };
}

auto page_size_bytes() -> double {
  static const auto ps = static_cast<double>(::sysconf(_SC_PAGESIZE));
  return ps;
}

/// Reads the "cpu" and "cpuN" lines of /proc/stat.
auto read_cpu_table() -> std::expected<ProcfsSampler::CpuTable, SamplingError> {
  std::ifstream stat_file("/proc/stat");
  if (!stat_file.is_open()) {
    return std::unexpected(open_failure("/proc/stat"));
  }

  ProcfsSampler::CpuTable table;
  std::string line;
  while (std::getline(stat_file, line)) {
    if (line.compare(0, 3, "cpu") != 0) {
      break;
    }
    std::istringstream ss(line);
    std::string label;
    ProcfsSampler::CpuTimes t;
    if (!(ss >> label >> t.user >> t.nice >> t.system >> t.idle)) {
      return std::unexpected(parse_failure("/proc/stat"));
    }
    // Older kernels stop after idle.
    if (!(ss >> t.iowait))
      t.iowait = 0;
    if (!(ss >> t.irq))
      t.irq = 0;
    if (!(ss >> t.softirq))
      t.softirq = 0;
    if (!(ss >> t.steal))
      t.steal = 0;
    table.push_back(t);
  }

  if (table.empty()) {
    return std::unexpected(parse_failure("/proc/stat"));
  }
  return table;
}

/// Reads MemTotal and MemAvailable (kB) from /proc/meminfo.
auto read_meminfo()
    -> std::expected<std::pair<std::uint64_t, std::uint64_t>, SamplingError> {
  std::ifstream meminfo("/proc/meminfo");
  if (!meminfo.is_open()) {
    return std::unexpected(open_failure("/proc/meminfo"));
  }

  std::uint64_t total_kb = 0;
  std::uint64_t available_kb = 0;
  std::string key;
  std::uint64_t value = 0;
  std::string unit;
  while (meminfo >> key >> value) {
    if (key == "MemTotal:") {
      total_kb = value;
    } else if (key == "MemAvailable:") {
      available_kb = value;
    }
    std::getline(meminfo, unit); // Rest of line ("kB").
  }

  if (total_kb == 0) {
    return std::unexpected(parse_failure("/proc/meminfo"));
  }
  return std::pair{total_kb, available_kb};
}

auto snapshot_from(const ProcfsSampler::CpuTable &before,
                   const ProcfsSampler::CpuTable &after) -> CpuSnapshot {
  CpuSnapshot snap;
  // CPU hotplug between readings: report nothing rather than mismatched
  // deltas.
  if (before.size() == after.size() && !after.empty()) {
    snap.percent_total = busy_percent(before.front(), after.front());
    snap.percent_per_core.reserve(after.size() - 1);
    for (std::size_t i = 1; i < after.size(); ++i) {
      snap.percent_per_core.push_back(busy_percent(before[i], after[i]));
    }
  } else {
    snap.percent_per_core.assign(after.empty() ? 0 : after.size() - 1, 0.0);
  }

  double loads[3] = {0.0, 0.0, 0.0};
  if (::getloadavg(loads, 3) == 3) {
    snap.load_average = {loads[0], loads[1], loads[2]};
  }
  return snap;
}

} // namespace

auto busy_percent(const ProcfsSampler::CpuTimes &before,
                  const ProcfsSampler::CpuTimes &after) noexcept -> double {
  if (after.total() <= before.total()) {
    return 0.0;
  }
  const auto delta_total = static_cast<double>(after.total() - before.total());
  const auto delta_busy = static_cast<double>(after.busy()) -
                          static_cast<double>(before.busy());
  return std::clamp(delta_busy / delta_total * 100.0, 0.0, 100.0);
}

// ─── ProcfsSampler ──────────────────────────────────────────────────────

auto ProcfsSampler::memory_snapshot() const
    -> std::expected<MemorySnapshot, SamplingError> {
  std::ifstream statm("/proc/self/statm");
  if (!statm.is_open()) {
    return std::unexpected(open_failure("/proc/self/statm"));
  }

  std::uint64_t size_pages = 0;
  std::uint64_t resident_pages = 0;
  if (!(statm >> size_pages >> resident_pages)) {
    return std::unexpected(parse_failure("/proc/self/statm"));
  }

  auto meminfo = read_meminfo();
  if (!meminfo) {
    return std::unexpected(std::move(meminfo.error()));
  }
  const auto [total_kb, available_kb] = *meminfo;

  const double resident_bytes =
      static_cast<double>(resident_pages) * page_size_bytes();
  const double total_bytes = static_cast<double>(total_kb) * 1024.0;

  return MemorySnapshot{
      .resident_mb = resident_bytes / kBytesPerMb,
      .virtual_mb =
          static_cast<double>(size_pages) * page_size_bytes() / kBytesPerMb,
      .percent_of_system = resident_bytes / total_bytes * 100.0,
      .system_available_mb = static_cast<double>(available_kb) / 1024.0,
  };
}

auto ProcfsSampler::cpu_snapshot(Seconds interval) const
    -> std::expected<CpuSnapshot, SamplingError> {
  if (interval > Seconds::zero()) {
    auto before = read_cpu_table();
    if (!before) {
      return std::unexpected(std::move(before.error()));
    }
    std::this_thread::sleep_for(interval);
    auto after = read_cpu_table();
    if (!after) {
      return std::unexpected(std::move(after.error()));
    }
    return snapshot_from(*before, *after);
  }

  auto current = read_cpu_table();
  if (!current) {
    return std::unexpected(std::move(current.error()));
  }
  std::lock_guard lock(cpu_mutex_);
  // First zero-interval call has no baseline; compare the table with itself.
  const auto &baseline = last_cpu_table_.empty() ? *current : last_cpu_table_;
  auto snap = snapshot_from(baseline, *current);
  last_cpu_table_ = std::move(*current);
  return snap;
}

auto ProcfsSampler::process_cpu_percent() const
    -> std::expected<double, SamplingError> {
  struct rusage usage {};
  if (::getrusage(RUSAGE_SELF, &usage) != 0) {
    return std::unexpected(SamplingError{
        .code = std::error_code{errno, std::generic_category()},
        .what = "getrusage(RUSAGE_SELF) failed",
    });
  }

  const auto to_us = [](const timeval &tv) {
    return std::chrono::seconds{tv.tv_sec} +
           std::chrono::microseconds{tv.tv_usec};
  };
  const std::chrono::microseconds cpu_now =
      to_us(usage.ru_utime) + to_us(usage.ru_stime);
  const auto wall_now = std::chrono::steady_clock::now();

  std::lock_guard lock(process_mutex_);
  double percent = 0.0;
  if (process_primed_) {
    const auto wall_delta =
        std::chrono::duration<double>(wall_now - last_process_wall_).count();
    const auto cpu_delta =
        std::chrono::duration<double>(cpu_now - last_process_cpu_).count();
    if (wall_delta > 0.0) {
      percent = std::max(0.0, cpu_delta / wall_delta * 100.0);
    }
  }
  process_primed_ = true;
  last_process_cpu_ = cpu_now;
  last_process_wall_ = wall_now;
  return percent;
}

// ─── Thread-count advice ────────────────────────────────────────────────

auto optimal_thread_count() -> std::size_t {
  const std::size_t logical =
      std::max<std::size_t>(1, std::thread::hardware_concurrency());

  // Unique (physical id, core id) pairs; absent on some architectures.
  std::set<std::pair<std::string, std::string>> cores;
  std::ifstream cpuinfo("/proc/cpuinfo");
  std::string line;
  std::string physical_id = "0";
  while (std::getline(cpuinfo, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    auto value = line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    if (line.rfind("physical id", 0) == 0) {
      physical_id = value;
    } else if (line.rfind("core id", 0) == 0) {
      cores.emplace(physical_id, value);
    }
  }

  const std::size_t physical = cores.empty() ? logical : cores.size();
  return std::min(logical, physical * 2);
}

} // namespace opscope
