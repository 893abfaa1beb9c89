/// @file test_threshold_guard.cpp
/// @brief Unit tests for ThresholdGuard observations.

#include "guard/threshold_guard.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace opscope;
using namespace std::chrono_literals;

class ThresholdGuardTest : public ::testing::Test {
protected:
  auto make_guard(GuardConfig cfg = {}) -> ThresholdGuard {
    cfg.cpu_sample_interval = 0s;
    return ThresholdGuard{sampler_, cfg, [this](const Observation &obs) {
                            observed_.push_back(obs);
                          }};
  }

  auto kinds() const -> std::vector<ObservationKind> {
    std::vector<ObservationKind> out;
    for (const auto &obs : observed_) {
      out.push_back(obs.kind);
    }
    return out;
  }

  test::FakeSampler sampler_;
  std::vector<Observation> observed_;
};

// ─── Pre-call checks ────────────────────────────────────────────────────

TEST_F(ThresholdGuardTest, QuietBelowThresholds) {
  auto guard = make_guard();
  Operation<int()> op = [] { return 7; };
  auto guarded = guard.wrap("quiet", op);

  EXPECT_EQ(guarded(), 7);
  EXPECT_TRUE(observed_.empty());
}

TEST_F(ThresholdGuardTest, HighMemoryWarnsButStillReturnsResult) {
  sampler_.set_resident_mb(600.0);
  auto guard = make_guard({.memory_threshold_mb = 500.0,
                           .cpu_threshold_percent = 80.0});
  Operation<std::string()> op = [] { return std::string{"result"}; };
  auto guarded = guard.wrap("scrape", op);

  EXPECT_EQ(guarded(), "result");
  ASSERT_EQ(observed_.size(), 1u);
  const auto &obs = observed_[0];
  EXPECT_EQ(obs.kind, ObservationKind::HighMemoryBefore);
  EXPECT_EQ(obs.operation, "scrape");
  EXPECT_DOUBLE_EQ(obs.value, 600.0);
  EXPECT_DOUBLE_EQ(obs.threshold, 500.0);
  EXPECT_EQ(obs.message, "High memory usage before scrape: 600.0MB");
}

TEST_F(ThresholdGuardTest, MemoryAtThresholdIsQuiet) {
  sampler_.set_resident_mb(500.0);
  auto guard = make_guard();
  Operation<int()> op = [] { return 1; };
  (void)guard.wrap("edge", op)();
  EXPECT_TRUE(observed_.empty());
}

TEST_F(ThresholdGuardTest, HighCpuWarns) {
  sampler_.set_cpu_percent(95.0);
  auto guard = make_guard();
  Operation<int()> op = [] { return 1; };
  (void)guard.wrap("busy", op)();

  EXPECT_EQ(kinds(), (std::vector{ObservationKind::HighCpuBefore}));
  EXPECT_EQ(observed_[0].message, "High CPU usage before busy: 95.0%");
}

TEST_F(ThresholdGuardTest, BothPreCallWarningsCanFire) {
  sampler_.set_resident_mb(900.0);
  sampler_.set_cpu_percent(99.0);
  auto guard = make_guard();
  Operation<int()> op = [] { return 1; };
  (void)guard.wrap("both", op)();

  EXPECT_EQ(kinds(), (std::vector{ObservationKind::HighMemoryBefore,
                                  ObservationKind::HighCpuBefore}));
}

// ─── Post-call growth ───────────────────────────────────────────────────

TEST_F(ThresholdGuardTest, GrowthAboveThresholdWarns) {
  sampler_.queue_resident_mb({100.0, 175.0});
  auto guard = make_guard();
  Operation<int()> op = [] { return 1; };
  (void)guard.wrap("grow", op)();

  ASSERT_EQ(kinds(), (std::vector{ObservationKind::MemoryGrowth}));
  EXPECT_DOUBLE_EQ(observed_[0].value, 75.0);
  EXPECT_EQ(observed_[0].message, "Function grow increased memory by 75.0MB");
}

TEST_F(ThresholdGuardTest, GrowthAtThresholdIsQuiet) {
  sampler_.queue_resident_mb({100.0, 150.0});
  auto guard = make_guard();
  Operation<int()> op = [] { return 1; };
  (void)guard.wrap("flat", op)();
  EXPECT_TRUE(observed_.empty());
}

TEST_F(ThresholdGuardTest, NoGrowthCheckWhenCallThrows) {
  sampler_.queue_resident_mb({100.0, 400.0});
  auto guard = make_guard();
  Operation<int()> op = []() -> int { throw std::runtime_error{"fail"}; };
  auto guarded = guard.wrap("throws", op);

  EXPECT_THROW((void)guarded(), std::runtime_error);
  EXPECT_TRUE(observed_.empty());
  EXPECT_EQ(sampler_.memory_calls(), 1u);
}

// ─── Sampling failures ──────────────────────────────────────────────────

TEST_F(ThresholdGuardTest, SamplingFailureIsObservedNotThrown) {
  sampler_.fail_memory(true);
  sampler_.fail_cpu(true);
  auto guard = make_guard();
  int calls = 0;
  Operation<int()> op = [&calls] { return ++calls; };

  EXPECT_EQ(guard.wrap("blind", op)(), 1);
  EXPECT_EQ(kinds(), (std::vector{ObservationKind::SamplingFailed,
                                  ObservationKind::SamplingFailed}));
  // No baseline, so no post-call sample.
  EXPECT_EQ(sampler_.memory_calls(), 1u);
}

TEST_F(ThresholdGuardTest, ThrowingSinkDoesNotBreakCall) {
  sampler_.set_resident_mb(1000.0);
  ThresholdGuard guard{sampler_, {.cpu_sample_interval = 0s},
                       [](const Observation &) {
                         throw std::runtime_error{"sink broke"};
                       }};
  Operation<int()> op = [] { return 3; };
  EXPECT_EQ(guard.wrap("robust", op)(), 3);
}

TEST_F(ThresholdGuardTest, SinkThrowingNonStandardTypeDoesNotBreakCall) {
  sampler_.set_resident_mb(1000.0);
  sampler_.queue_resident_mb({1000.0, 1200.0});
  ThresholdGuard guard{sampler_, {.cpu_sample_interval = 0s},
                       [](const Observation &) { throw 42; }};
  int calls = 0;
  Operation<int()> op = [&calls] { return ++calls; };

  EXPECT_EQ(guard.wrap("odd_sink", op)(), 1);
  EXPECT_EQ(calls, 1);
}

// ─── Shapes ─────────────────────────────────────────────────────────────

TEST_F(ThresholdGuardTest, VoidOperation) {
  sampler_.queue_resident_mb({10.0, 100.0});
  auto guard = make_guard();
  bool ran = false;
  Operation<void()> op = [&ran] { ran = true; };
  guard.wrap("side_effect", op)();

  EXPECT_TRUE(ran);
  EXPECT_EQ(kinds(), (std::vector{ObservationKind::MemoryGrowth}));
}

TEST_F(ThresholdGuardTest, ArgumentsAreForwarded) {
  auto guard = make_guard();
  Operation<std::string(const std::string &, int)> op =
      [](const std::string &s, int n) {
        std::string out;
        for (int i = 0; i < n; ++i) {
          out += s;
        }
        return out;
      };
  EXPECT_EQ(guard.wrap("repeat", op)("ab", 3), "ababab");
}

TEST_F(ThresholdGuardTest, DefaultSinkLogs) {
  sampler_.set_resident_mb(700.0);
  ThresholdGuard guard{sampler_, {.cpu_sample_interval = 0s}};
  Operation<int()> op = [] { return 5; };
  EXPECT_EQ(guard.wrap("logged", op)(), 5);
}

TEST(ObservationKindTest, Names) {
  EXPECT_STREQ(to_string(ObservationKind::HighMemoryBefore),
               "high_memory_before");
  EXPECT_STREQ(to_string(ObservationKind::MemoryGrowth), "memory_growth");
}
