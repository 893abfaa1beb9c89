#include "cache/instrumented_cache.hpp"
#include "metrics/metrics_registry.hpp"
#include "sampler/resource_sampler.hpp"
#include <benchmark/benchmark.h>
#include <string>
#include <thread>
#include <vector>

using namespace opscope;

namespace {

// Fixed readings, so the numbers measure the cache and not /proc.
class ConstantSampler final : public ResourceSampler {
public:
  auto memory_snapshot() const
      -> std::expected<MemorySnapshot, SamplingError> override {
    return MemorySnapshot{.resident_mb = 128.0,
                          .virtual_mb = 512.0,
                          .percent_of_system = 0.8,
                          .system_available_mb = 8192.0};
  }
  auto cpu_snapshot(Seconds) const
      -> std::expected<CpuSnapshot, SamplingError> override {
    return CpuSnapshot{.percent_total = 10.0};
  }
  auto process_cpu_percent() const
      -> std::expected<double, SamplingError> override {
    return 5.0;
  }
};

ConstantSampler sampler;

} // namespace

// Hit path: key derivation + table lookup + hit counter.
static void BM_Cache_Hit(benchmark::State &state) {
  MetricsRegistry registry{sampler};
  InstrumentedCache<int(int)> cache{registry, {.capacity = 1024}};
  auto f = cache.wrap("hit", [](int x) { return x * 2; });
  (void)f(7);

  for (auto _ : state) {
    benchmark::DoNotOptimize(f(7));
  }
}

// Miss path: every call inserts a new key and evicts the oldest.
static void BM_Cache_MissWithEviction(benchmark::State &state) {
  MetricsRegistry registry{sampler};
  InstrumentedCache<int(int)> cache{
      registry, {.capacity = static_cast<std::size_t>(state.range(0))}};
  auto f = cache.wrap("miss", [](int x) { return x * 2; });

  int key = 0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(f(key++));
  }
}

// Composite keys: vector argument encoded through nlohmann::json.
static void BM_Cache_VectorKey(benchmark::State &state) {
  MetricsRegistry registry{sampler};
  InstrumentedCache<std::size_t(const std::vector<int> &)> cache{
      registry, {.capacity = 64}};
  auto f = cache.wrap("vec", [](const std::vector<int> &v) { return v.size(); });
  std::vector<int> arg(static_cast<std::size_t>(state.range(0)), 42);
  (void)f(arg);

  for (auto _ : state) {
    benchmark::DoNotOptimize(f(arg));
  }
}

// Shared table hit by many threads over a small keyspace.
static void BM_Cache_Contention(benchmark::State &state) {
  static MetricsRegistry registry{sampler};
  static InstrumentedCache<int(int)> cache{registry, {.capacity = 256}};
  static auto f = cache.wrap("contended", [](int x) { return x + 1; });

  int key = state.thread_index();
  for (auto _ : state) {
    benchmark::DoNotOptimize(f(key));
    key = (key + 1) % 128;
  }
}

BENCHMARK(BM_Cache_Hit);
BENCHMARK(BM_Cache_MissWithEviction)->Arg(16)->Arg(1024);
BENCHMARK(BM_Cache_VectorKey)->Arg(8)->Arg(256);
BENCHMARK(BM_Cache_Contention)
    ->ThreadRange(1, std::thread::hardware_concurrency());

BENCHMARK_MAIN();
