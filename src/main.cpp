/// @file main.cpp
/// @brief Demo program: wraps a synthetic listing-analysis workload with the
///        cache, threshold guard and batch executor, drives it from several
///        threads, and prints the metrics report.

#include "interface/instrumentation.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace opscope;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct DemoArgs {
  std::size_t requests = 400;  // Per thread.
  std::size_t threads = 4;
  std::size_t keyspace = 64;   // Distinct lookups; smaller = more hits.
  std::size_t capacity = 32;
  std::size_t ttl_ms = 0;      // 0 = entries never expire.
  std::size_t batch_size = 25;
  std::size_t listings = 200;  // Listings analyzed per lookup.
  std::size_t work_us = 20;    // Simulated work per listing chunk.
  double memory_threshold_mb = 500.0;
  double cpu_threshold_percent = 80.0;
  std::size_t cpu_interval_ms = 0;
  bool json = false;
  std::string export_path;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --requests <N>         Lookups per thread (default: 400)\n"
      << "  --threads <N>          Caller threads (default: 4)\n"
      << "  --keyspace <N>         Distinct lookup keys (default: 64)\n"
      << "  --capacity <N>         Cache capacity (default: 32)\n"
      << "  --ttl-ms <N>           Cache TTL in ms, 0 = none (default: 0)\n"
      << "  --batch-size <N>       Listings per batch (default: 25)\n"
      << "  --listings <N>         Listings per lookup (default: 200)\n"
      << "  --work-us <N>          Simulated work per chunk (default: 20)\n"
      << "  --memory-threshold <MB> Guard memory threshold (default: 500)\n"
      << "  --cpu-threshold <PCT>  Guard CPU threshold (default: 80)\n"
      << "  --cpu-interval-ms <N>  Guard CPU sampling interval (default: 0)\n"
      << "  --json                 Print the report as JSON\n"
      << "  --export <PATH>        Also write the JSON report to PATH\n"
      << "  --help                 Show this help\n";
}

auto parse_args(int argc, char *argv[]) -> DemoArgs {
  DemoArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--requests" && i + 1 < argc) {
      args.requests = std::stoull(argv[++i]);
    } else if (arg == "--threads" && i + 1 < argc) {
      args.threads = std::stoull(argv[++i]);
    } else if (arg == "--keyspace" && i + 1 < argc) {
      args.keyspace = std::stoull(argv[++i]);
    } else if (arg == "--capacity" && i + 1 < argc) {
      args.capacity = std::stoull(argv[++i]);
    } else if (arg == "--ttl-ms" && i + 1 < argc) {
      args.ttl_ms = std::stoull(argv[++i]);
    } else if (arg == "--batch-size" && i + 1 < argc) {
      args.batch_size = std::stoull(argv[++i]);
    } else if (arg == "--listings" && i + 1 < argc) {
      args.listings = std::stoull(argv[++i]);
    } else if (arg == "--work-us" && i + 1 < argc) {
      args.work_us = std::stoull(argv[++i]);
    } else if (arg == "--memory-threshold" && i + 1 < argc) {
      args.memory_threshold_mb = std::stod(argv[++i]);
    } else if (arg == "--cpu-threshold" && i + 1 < argc) {
      args.cpu_threshold_percent = std::stod(argv[++i]);
    } else if (arg == "--cpu-interval-ms" && i + 1 < argc) {
      args.cpu_interval_ms = std::stoull(argv[++i]);
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--export" && i + 1 < argc) {
      args.export_path = argv[++i];
    }
  }
  if (args.keyspace == 0)
    args.keyspace = 1;
  if (args.threads == 0)
    args.threads = 1;
  return args;
}

// ─── Workload ───────────────────────────────────────────────────────────

/// Listing ids belonging to one lookup key.
auto listings_for(int key, std::size_t count) -> std::vector<int> {
  std::vector<int> ids(count);
  for (std::size_t i = 0; i < count; ++i) {
    ids[i] = key * 1000 + static_cast<int>(i);
  }
  return ids;
}

/// Scores one chunk of listings.
auto make_scorer(std::size_t work_us)
    -> Operation<std::vector<double>(const std::vector<int> &)> {
  return [work_us](const std::vector<int> &ids) {
    std::vector<double> scores;
    scores.reserve(ids.size());
    for (int id : ids) {
      scores.push_back(std::fmod(std::sqrt(static_cast<double>(id)), 1.0));
    }
    if (work_us > 0) {
      std::this_thread::sleep_for(std::chrono::microseconds(work_us));
    }
    return scores;
  };
}

// ─── Report formatting ─────────────────────────────────────────────────

void print_separator() { std::cout << std::string(60, '=') << '\n'; }

void print_report(const MetricsReport &report) {
  std::cout << '\n';
  print_separator();
  std::cout << "  OPERATION METRICS\n";
  print_separator();

  std::cout << std::fixed << std::setprecision(2);
  for (const auto &[name, r] : report) {
    std::cout << "\n  " << name << '\n'
              << "    Calls:        " << r.total_calls << '\n'
              << "    Avg latency:  " << r.avg_execution_time_ms << " ms\n"
              << "    Avg CPU:      " << r.avg_cpu_percent << " %\n"
              << "    Avg RSS:      " << r.avg_memory_mb << " MB\n"
              << "    Cache hits:   " << r.total_cache_hits << '\n'
              << "    Cache misses: " << r.total_cache_misses << '\n'
              << "    Hit rate:     " << r.cache_hit_rate_percent << " %\n";
  }
  std::cout << '\n';
  print_separator();
}

} // namespace

int main(int argc, char *argv[]) {
  const auto args = parse_args(argc, argv);

  auto created = Instrumentation::create();
  if (!created) {
    std::cerr << "Failed to initialize instrumentation: "
              << created.error().message() << '\n';
    return 1;
  }
  auto &inst = *created;

  CacheConfig cache_cfg{.capacity = args.capacity};
  if (args.ttl_ms > 0) {
    cache_cfg.ttl = std::chrono::milliseconds(args.ttl_ms);
  }

  // cache ∘ guard ∘ batch, innermost first.
  auto batched = inst.wrap_with_batching(make_scorer(args.work_us),
                                         args.batch_size);
  auto guarded = inst.wrap_with_threshold_guard(
      "score_listings", std::move(batched),
      GuardConfig{
          .memory_threshold_mb = args.memory_threshold_mb,
          .cpu_threshold_percent = args.cpu_threshold_percent,
          .cpu_sample_interval =
              std::chrono::milliseconds(args.cpu_interval_ms),
      });
  auto cache = inst.make_cache<std::vector<double>(const std::vector<int> &)>(
      cache_cfg);
  auto score = cache.wrap("score_listings", std::move(guarded));

  std::atomic<std::size_t> scored{0};
  std::vector<std::thread> workers;
  workers.reserve(args.threads);
  for (std::size_t t = 0; t < args.threads; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937 rng{static_cast<unsigned>(t + 1)};
      std::uniform_int_distribution<int> pick{
          0, static_cast<int>(args.keyspace) - 1};
      for (std::size_t i = 0; i < args.requests; ++i) {
        auto result = score(listings_for(pick(rng), args.listings));
        scored.fetch_add(result.size(), std::memory_order_relaxed);
      }
    });
  }
  for (auto &w : workers) {
    w.join();
  }

  const auto info = cache.info();
  if (args.json) {
    std::cout << inst.report_json() << '\n';
  } else {
    print_report(inst.report());
    std::cout << "  Listings scored: " << scored.load() << '\n'
              << "  Cache entries:   " << info.size << " / " << info.capacity
              << '\n';
  }

  if (!args.export_path.empty()) {
    if (auto written = inst.export_report(args.export_path); !written) {
      return 1;
    }
  }
  return 0;
}
