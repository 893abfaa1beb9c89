#pragma once
/// @file instrumentation.hpp
/// @brief Single-entry-point façade owning the monitoring stack.
///
/// Owns the ResourceSampler, MetricsRegistry, MemoryReclaimer and the
/// observation sink, and hands out wrapped operations that report into them.
/// Construct one per process (or per test) and pass it to whoever wraps
/// operations; there is no global instance.
///
/// Usage:
/// @code
///   auto inst = opscope::Instrumentation::create().value();
///   auto lookup = inst.wrap_with_cache<Listing(std::string)>(
///       "lookup", fetch_listing, {.capacity = 256, .ttl = 10min});
///   auto listing = lookup("leeds");
///   std::cout << inst.report_json();
/// @endcode
///
/// Wrapped operations keep references into the façade and must not be
/// called after it is destroyed.

#include "batch/batch_executor.hpp"
#include "cache/instrumented_cache.hpp"
#include "guard/threshold_guard.hpp"
#include "interface/operation.hpp"
#include "metrics/metrics_registry.hpp"
#include "metrics/timed_operation.hpp"
#include "observe/observation.hpp"
#include "sampler/memory_reclaimer.hpp"
#include "sampler/resource_sampler.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace opscope {

/// @brief Configuration for Instrumentation construction.
struct InstrumentationConfig {
  /// Measurement source; nullptr selects ProcfsSampler.
  std::shared_ptr<const ResourceSampler> sampler = nullptr;
  /// Observation receiver for guards; empty selects log_sink().
  ObservationSink sink = {};
  /// Level applied to the "opscope" logger.
  spdlog::level::level_enum log_level = spdlog::level::info;
  /// Reclamation points between batch chunks.
  std::size_t reclaim_every = 10;
};

class Instrumentation {
public:
  /// @brief Build the stack and probe the sampler once.
  /// @return The façade, or the error code of a failing first memory query.
  [[nodiscard]] static auto create(InstrumentationConfig cfg = {})
      -> std::expected<Instrumentation, std::error_code>;

  ~Instrumentation();

  Instrumentation(Instrumentation &&other) noexcept;
  Instrumentation &operator=(Instrumentation &&other) noexcept;
  Instrumentation(const Instrumentation &) = delete;
  Instrumentation &operator=(const Instrumentation &) = delete;

  // ─── Wrappers ────────────────────────────────────────────────────────

  /// @brief Memoize @p op in a new cache table bounded by @p cfg.
  template <typename Sig>
  auto wrap_with_cache(std::string name, Operation<Sig> op,
                       CacheConfig cfg = {}) -> Operation<Sig> {
    InstrumentedCache<Sig> cache{registry(), cfg};
    return cache.wrap(std::move(name), std::move(op));
  }

  /// @brief A cache bound to this registry, for callers that need
  /// clear()/info() on the table.
  template <typename Sig>
  auto make_cache(CacheConfig cfg = {}) -> InstrumentedCache<Sig> {
    return InstrumentedCache<Sig>{registry(), cfg};
  }

  /// @brief Observe memory/CPU around each call of @p op.
  template <typename Sig>
  auto wrap_with_threshold_guard(std::string name, Operation<Sig> op,
                                 GuardConfig cfg = {}) -> Operation<Sig> {
    return ThresholdGuard{sampler(), cfg, sink()}.wrap(std::move(name),
                                                       std::move(op));
  }

  /// @brief Split sequence input into chunks of @p batch_size.
  template <typename Sig>
  auto wrap_with_batching(Operation<Sig> op, std::size_t batch_size) {
    return BatchExecutor{BatchConfig{.batch_size = batch_size,
                                     .reclaim_every = reclaim_every()},
                         reclaim_hook()}
        .wrap(std::move(op));
  }

  /// @brief Record the latency of every call of @p op.
  template <typename Sig>
  auto wrap_with_timing(std::string name, Operation<Sig> op)
      -> Operation<Sig> {
    return opscope::wrap_with_timing(registry(), std::move(name),
                                     std::move(op));
  }

  // ─── Reporting ───────────────────────────────────────────────────────

  [[nodiscard]] auto report() const -> MetricsReport;

  /// @brief The report serialized as indented JSON.
  [[nodiscard]] auto report_json() const -> std::string;

  /// @brief Write the report to @p path (see export_report()).
  [[nodiscard]] auto export_report(const std::filesystem::path &path) const
      -> std::expected<void, std::error_code>;

  // ─── Accessors ───────────────────────────────────────────────────────

  [[nodiscard]] auto registry() noexcept -> MetricsRegistry &;
  [[nodiscard]] auto registry() const noexcept -> const MetricsRegistry &;
  [[nodiscard]] auto sampler() const noexcept -> const ResourceSampler &;
  [[nodiscard]] auto reclaimer() const noexcept -> const MemoryReclaimer &;
  [[nodiscard]] auto sink() const -> ObservationSink;

  /// @brief Hook that runs the reclaimer and logs what it freed.
  [[nodiscard]] auto reclaim_hook() const -> ReclaimHook;

private:
  struct Impl;

  explicit Instrumentation(std::unique_ptr<Impl> impl) noexcept;
  [[nodiscard]] auto reclaim_every() const noexcept -> std::size_t;

  // unique_ptr keeps the registry and sampler at stable addresses while the
  // façade itself moves; wrapped operations point into them.
  std::unique_ptr<Impl> impl_;
};

} // namespace opscope
