#include "metrics/metrics_registry.hpp"
#include "sampler/resource_sampler.hpp"
#include "serialization/json_serializer.hpp"
#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

using namespace opscope;

// record() with live /proc sampling, as production callers pay it.
static void BM_Registry_RecordProcfs(benchmark::State &state) {
  ProcfsSampler sampler;
  MetricsRegistry registry{sampler};

  for (auto _ : state) {
    registry.record("op", 0.001);
  }
}

static void BM_Registry_RecordContention(benchmark::State &state) {
  static ProcfsSampler sampler;
  static MetricsRegistry registry{sampler};

  for (auto _ : state) {
    registry.record("shared", 0.001);
    registry.record_cache_hit("shared");
  }
}

// report() over N operations with full sample windows.
static void BM_Registry_Report(benchmark::State &state) {
  ProcfsSampler sampler;
  MetricsRegistry registry{sampler};
  for (int op = 0; op < state.range(0); ++op) {
    const auto name = "op_" + std::to_string(op);
    for (std::size_t i = 0; i < MetricsRegistry::kMaxSamples; ++i) {
      registry.record(name, 0.001);
    }
  }

  for (auto _ : state) {
    auto report = registry.report();
    benchmark::DoNotOptimize(report);
  }
}

static void BM_Registry_ReportJson(benchmark::State &state) {
  ProcfsSampler sampler;
  MetricsRegistry registry{sampler};
  for (int op = 0; op < 32; ++op) {
    registry.record("op_" + std::to_string(op), 0.001);
  }

  for (auto _ : state) {
    std::string s = report_to_json(registry.report()).dump(2);
    benchmark::DoNotOptimize(s);
  }
}

BENCHMARK(BM_Registry_RecordProcfs);
BENCHMARK(BM_Registry_RecordContention)
    ->ThreadRange(1, std::thread::hardware_concurrency());
BENCHMARK(BM_Registry_Report)->Arg(1)->Arg(64);
BENCHMARK(BM_Registry_ReportJson);

BENCHMARK_MAIN();
