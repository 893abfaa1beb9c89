/// @file test_instrumented_cache.cpp
/// @brief Unit tests for InstrumentedCache: hits, eviction order, TTL expiry,
///        failure handling and concurrent access.

#include "cache/instrumented_cache.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace opscope;
using namespace std::chrono_literals;

// ─── Helpers ────────────────────────────────────────────────────────────

using ManualCache = InstrumentedCache<std::string(int), test::ManualClock>;

class InstrumentedCacheTest : public ::testing::Test {
protected:
  void SetUp() override { test::ManualClock::reset(); }

  /// f(1)→"A", f(2)→"B", ...; counts invocations.
  auto letters() -> Operation<std::string(int)> {
    return [this](int x) {
      ++calls_;
      return std::string(1, static_cast<char>('A' + x - 1));
    };
  }

  test::FakeSampler sampler_;
  MetricsRegistry registry_{sampler_};
  std::atomic<int> calls_{0};
};

// ─── Hits and misses ────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, HitDoesNotReinvoke) {
  ManualCache cache{registry_, {.capacity = 8}};
  auto f = cache.wrap("f", letters());

  EXPECT_EQ(f(1), "A");
  EXPECT_EQ(f(1), "A");
  EXPECT_EQ(f(1), "A");

  EXPECT_EQ(calls_.load(), 1);
  auto info = cache.info();
  EXPECT_EQ(info.hits, 2u);
  EXPECT_EQ(info.misses, 1u);
  EXPECT_EQ(info.size, 1u);
}

TEST_F(InstrumentedCacheTest, OnlyMissesRecordLatency) {
  ManualCache cache{registry_, {.capacity = 8}};
  auto f = cache.wrap("f", letters());

  (void)f(1);
  (void)f(1);
  (void)f(2);

  auto samples = registry_.samples("f");
  ASSERT_EQ(samples.size(), 2u);
  // The second sample sees the hit that preceded it.
  EXPECT_EQ(samples[1].cache_hits, 1u);
  EXPECT_EQ(samples[1].cache_misses, 2u);
}

// ─── Eviction ───────────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, EvictsOldestInsertionNotLeastRecentlyUsed) {
  ManualCache cache{registry_, {.capacity = 2}};
  auto f = cache.wrap("f", letters());

  EXPECT_EQ(f(1), "A"); // miss, table={1}
  test::ManualClock::advance(1ms);
  EXPECT_EQ(f(2), "B"); // miss, table={1,2}
  test::ManualClock::advance(1ms);

  const auto key1 = ManualCache::key_for(1);
  const auto key2 = ManualCache::key_for(2);
  const auto key3 = ManualCache::key_for(3);
  const auto inserted1 = cache.inserted_at(key1);
  ASSERT_TRUE(inserted1.has_value());

  EXPECT_EQ(f(1), "A"); // hit, timestamp unchanged
  EXPECT_EQ(cache.inserted_at(key1), inserted1);
  test::ManualClock::advance(1ms);

  EXPECT_EQ(f(3), "C"); // miss, evicts key 1
  EXPECT_EQ(cache.keys(), (std::vector<std::string>{key2, key3}));
  EXPECT_FALSE(cache.inserted_at(key1).has_value());

  auto info = cache.info();
  EXPECT_EQ(info.size, 2u);
  EXPECT_EQ(info.hits, 1u);
  EXPECT_EQ(info.misses, 3u);
  EXPECT_EQ(calls_.load(), 3);
}

TEST_F(InstrumentedCacheTest, SizeNeverExceedsCapacity) {
  ManualCache cache{registry_, {.capacity = 3}};
  auto f = cache.wrap("f", letters());

  for (int i = 1; i <= 20; ++i) {
    (void)f(i);
    EXPECT_LE(cache.info().size, 3u);
  }
  EXPECT_EQ(cache.keys(),
            (std::vector<std::string>{ManualCache::key_for(18),
                                      ManualCache::key_for(19),
                                      ManualCache::key_for(20)}));
}

TEST_F(InstrumentedCacheTest, SameTimestampEvictsFirstInserted) {
  ManualCache cache{registry_, {.capacity = 2}};
  auto f = cache.wrap("f", letters());

  (void)f(1);
  (void)f(2);
  (void)f(3);
  EXPECT_EQ(cache.keys(), (std::vector<std::string>{ManualCache::key_for(2),
                                                    ManualCache::key_for(3)}));
}

// ─── TTL ────────────────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, EntryExpiresAfterTtl) {
  ManualCache cache{registry_, {.capacity = 8, .ttl = 10s}};
  auto f = cache.wrap("f", letters());

  (void)f(1);
  test::ManualClock::advance(9s);
  (void)f(1);
  EXPECT_EQ(calls_.load(), 1);

  test::ManualClock::advance(1s + 1ns);
  (void)f(1);
  EXPECT_EQ(calls_.load(), 2);

  auto info = cache.info();
  EXPECT_EQ(info.hits, 1u);
  EXPECT_EQ(info.misses, 2u);
  EXPECT_EQ(info.size, 1u);
  // Reinserted with a fresh timestamp.
  EXPECT_EQ(cache.inserted_at(ManualCache::key_for(1)),
            test::ManualClock::now());
}

TEST_F(InstrumentedCacheTest, EntryAtExactlyTtlIsExpired) {
  ManualCache cache{registry_, {.capacity = 8, .ttl = 5s}};
  auto f = cache.wrap("f", letters());

  (void)f(1);
  test::ManualClock::advance(5s);
  (void)f(1);
  EXPECT_EQ(calls_.load(), 2);
}

TEST_F(InstrumentedCacheTest, ExpiredEntryIsRemovedEvenIfRecomputeFails) {
  ManualCache cache{registry_, {.capacity = 8, .ttl = 1s}};
  bool fail = false;
  auto f = cache.wrap("f", [&fail](int x) -> std::string {
    if (fail) {
      throw std::runtime_error{"backend down"};
    }
    return std::to_string(x);
  });

  (void)f(1);
  EXPECT_EQ(cache.info().size, 1u);

  test::ManualClock::advance(2s);
  fail = true;
  EXPECT_THROW((void)f(1), std::runtime_error);
  EXPECT_EQ(cache.info().size, 0u);
}

TEST_F(InstrumentedCacheTest, InfoReportsTtl) {
  ManualCache cache{registry_, {.capacity = 4, .ttl = 250ms}};
  auto info = cache.info();
  EXPECT_EQ(info.capacity, 4u);
  ASSERT_TRUE(info.ttl.has_value());
  EXPECT_EQ(*info.ttl, 250ms);

  ManualCache forever{registry_, {.capacity = 4}};
  EXPECT_FALSE(forever.info().ttl.has_value());
}

// ─── Failures ───────────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, FailureIsPropagatedAndNotCached) {
  ManualCache cache{registry_, {.capacity = 8}};
  auto f = cache.wrap("f", [this](int x) -> std::string {
    ++calls_;
    if (x < 0) {
      throw std::domain_error{"negative"};
    }
    return "ok";
  });

  EXPECT_THROW((void)f(-1), std::domain_error);
  EXPECT_THROW((void)f(-1), std::domain_error);

  EXPECT_EQ(calls_.load(), 2);
  auto info = cache.info();
  EXPECT_EQ(info.size, 0u);
  EXPECT_EQ(info.misses, 2u);
  // Latency of failed calls is still recorded.
  EXPECT_EQ(registry_.samples("f").size(), 2u);
}

TEST_F(InstrumentedCacheTest, UnencodableArgumentFailsBeforeInvoke) {
  InstrumentedCache<double(double)> cache{registry_, {.capacity = 8}};
  int calls = 0;
  auto f = cache.wrap("sqrt", [&calls](double x) {
    ++calls;
    return x;
  });

  EXPECT_THROW((void)f(std::numeric_limits<double>::quiet_NaN()),
               KeyDerivationError);
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(cache.info().misses, 0u);
  EXPECT_TRUE(registry_.samples("sqrt").empty());
}

// ─── Lifecycle ──────────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, ClearEmptiesTable) {
  ManualCache cache{registry_, {.capacity = 8}};
  auto f = cache.wrap("f", letters());

  (void)f(1);
  (void)f(2);
  cache.clear();
  EXPECT_EQ(cache.info().size, 0u);
  EXPECT_TRUE(cache.keys().empty());

  (void)f(1);
  EXPECT_EQ(calls_.load(), 3);
}

TEST_F(InstrumentedCacheTest, ZeroCapacityIsRejected) {
  EXPECT_THROW((ManualCache{registry_, {.capacity = 0}}),
               std::invalid_argument);
}

TEST_F(InstrumentedCacheTest, SecondWrapIsRejected) {
  ManualCache cache{registry_, {.capacity = 8}};
  (void)cache.wrap("f", letters());
  EXPECT_THROW((void)cache.wrap("g", letters()), std::logic_error);
}

TEST_F(InstrumentedCacheTest, WrappedOperationOutlivesCacheObject) {
  Operation<std::string(int)> f;
  {
    ManualCache cache{registry_, {.capacity = 8}};
    f = cache.wrap("f", letters());
  }
  EXPECT_EQ(f(2), "B");
  EXPECT_EQ(f(2), "B");
  EXPECT_EQ(calls_.load(), 1);
}

// ─── Concurrency ────────────────────────────────────────────────────────

TEST_F(InstrumentedCacheTest, DistinctKeysComputeInParallel) {
  InstrumentedCache<int(int)> cache{registry_, {.capacity = 64}};
  std::atomic<int> active{0};
  std::atomic<int> peak{0};

  auto f = cache.wrap("slow", [&](int x) {
    const int now = ++active;
    int seen = peak.load();
    while (seen < now && !peak.compare_exchange_weak(seen, now)) {
    }
    // Hold the slot until a second caller overlaps, or give up.
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (peak.load() < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(1ms);
    }
    --active;
    return x * 10;
  });

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&f, i] { EXPECT_EQ(f(i), i * 10); });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_GE(peak.load(), 2);
  EXPECT_EQ(cache.info().misses, 4u);
}

TEST_F(InstrumentedCacheTest, SameKeyComputesOnce) {
  InstrumentedCache<int(int)> cache{registry_, {.capacity = 64}};
  std::atomic<int> calls{0};
  auto f = cache.wrap("once", [&calls](int x) {
    ++calls;
    std::this_thread::sleep_for(50ms);
    return x + 1;
  });

  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&f] { EXPECT_EQ(f(41), 42); });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(calls.load(), 1);
  auto info = cache.info();
  EXPECT_EQ(info.misses, 1u);
  EXPECT_EQ(info.hits, static_cast<std::uint64_t>(kThreads - 1));
}

TEST_F(InstrumentedCacheTest, WaiterTakesOverAfterOwnerFails) {
  InstrumentedCache<int(int)> cache{registry_, {.capacity = 64}};
  std::atomic<int> calls{0};
  auto f = cache.wrap("flaky", [&calls](int x) {
    if (++calls == 1) {
      std::this_thread::sleep_for(50ms);
      throw std::runtime_error{"first attempt fails"};
    }
    return x;
  });

  std::atomic<int> failures{0};
  std::thread owner([&] {
    try {
      (void)f(7);
    } catch (const std::runtime_error &) {
      ++failures;
    }
  });
  std::this_thread::sleep_for(10ms);
  std::thread waiter([&] {
    try {
      EXPECT_EQ(f(7), 7);
    } catch (const std::runtime_error &) {
      ++failures;
    }
  });
  owner.join();
  waiter.join();

  // One caller saw the failure; the other recomputed and cached.
  EXPECT_EQ(failures.load(), 1);
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(cache.info().size, 1u);
  EXPECT_EQ(cache.info().misses, 2u);
}
