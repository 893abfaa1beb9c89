/// @file instrumentation.cpp
/// @brief Implementation of the Instrumentation façade.

#include "interface/instrumentation.hpp"
#include "serialization/json_serializer.hpp"

#include <nlohmann/json.hpp>

namespace opscope {

// ─── Impl Definition ─────────────────────────────────────────────────────

struct Instrumentation::Impl {
  explicit Impl(InstrumentationConfig cfg)
      : sampler{cfg.sampler ? std::move(cfg.sampler)
                            : std::shared_ptr<const ResourceSampler>{
                                  std::make_shared<ProcfsSampler>()}},
        registry{*sampler}, reclaimer{*sampler},
        sink{cfg.sink ? std::move(cfg.sink) : log_sink()},
        reclaim_every{cfg.reclaim_every} {}

  std::shared_ptr<const ResourceSampler> sampler;
  MetricsRegistry registry;
  MemoryReclaimer reclaimer;
  ObservationSink sink;
  std::size_t reclaim_every;
};

// ─── Construction ────────────────────────────────────────────────────────

auto Instrumentation::create(InstrumentationConfig cfg)
    -> std::expected<Instrumentation, std::error_code> {
  logger()->set_level(cfg.log_level);

  auto impl = std::make_unique<Impl>(std::move(cfg));
  if (auto probe = impl->sampler->memory_snapshot(); !probe) {
    logger()->error("Resource sampler unavailable: {}", probe.error().what);
    return std::unexpected(probe.error().code);
  }
  return Instrumentation{std::move(impl)};
}

Instrumentation::Instrumentation(std::unique_ptr<Impl> impl) noexcept
    : impl_{std::move(impl)} {}

Instrumentation::~Instrumentation() = default;

Instrumentation::Instrumentation(Instrumentation &&other) noexcept = default;

Instrumentation &
Instrumentation::operator=(Instrumentation &&other) noexcept = default;

// ─── Reporting ───────────────────────────────────────────────────────────

auto Instrumentation::report() const -> MetricsReport {
  return impl_->registry.report();
}

auto Instrumentation::report_json() const -> std::string {
  return report_to_json(report()).dump(2);
}

auto Instrumentation::export_report(const std::filesystem::path &path) const
    -> std::expected<void, std::error_code> {
  auto written = opscope::export_report(report(), path);
  if (written) {
    logger()->info("Metrics exported to {}", path.string());
  } else {
    logger()->error("Error exporting metrics to {}: {}", path.string(),
                    written.error().message());
  }
  return written;
}

// ─── Accessors ───────────────────────────────────────────────────────────

auto Instrumentation::registry() noexcept -> MetricsRegistry & {
  return impl_->registry;
}

auto Instrumentation::registry() const noexcept -> const MetricsRegistry & {
  return impl_->registry;
}

auto Instrumentation::sampler() const noexcept -> const ResourceSampler & {
  return *impl_->sampler;
}

auto Instrumentation::reclaimer() const noexcept -> const MemoryReclaimer & {
  return impl_->reclaimer;
}

auto Instrumentation::sink() const -> ObservationSink { return impl_->sink; }

auto Instrumentation::reclaim_every() const noexcept -> std::size_t {
  return impl_->reclaim_every;
}

auto Instrumentation::reclaim_hook() const -> ReclaimHook {
  const MemoryReclaimer *reclaimer = &impl_->reclaimer;
  return [reclaimer] {
    auto freed = reclaimer->reclaim();
    if (freed) {
      logger()->debug("Memory reclamation freed {:.1f}MB", *freed);
    } else {
      logger()->warn("Memory reclamation could not be measured: {}",
                     freed.error().what);
    }
  };
}

} // namespace opscope
