/// @file threshold_guard.cpp
/// @brief Implementation of ThresholdGuard's observation points.

#include "guard/threshold_guard.hpp"

#include <spdlog/fmt/fmt.h>

#include <exception>

namespace opscope {

ThresholdGuard::ThresholdGuard(const ResourceSampler &sampler, GuardConfig cfg,
                               ObservationSink sink)
    : sampler_{&sampler}, cfg_{cfg}, sink_{std::move(sink)} {}

void ThresholdGuard::emit(Observation obs) const {
  if (!sink_) {
    return;
  }
  // A faulty sink must not break the guarded call.
  try {
    sink_(obs);
  } catch (const std::exception &e) {
    logger()->error("Observation sink failed for {}: {}", obs.operation,
                    e.what());
  } catch (...) {
    logger()->error("Observation sink failed for {}: non-standard exception",
                    obs.operation);
  }
}

auto ThresholdGuard::before_call(std::string_view operation) const
    -> std::optional<double> {
  std::optional<double> baseline;

  auto memory = sampler_->memory_snapshot();
  if (memory) {
    baseline = memory->resident_mb;
    if (memory->resident_mb > cfg_.memory_threshold_mb) {
      emit(Observation{
          .kind = ObservationKind::HighMemoryBefore,
          .operation = std::string{operation},
          .value = memory->resident_mb,
          .threshold = cfg_.memory_threshold_mb,
          .message = fmt::format("High memory usage before {}: {:.1f}MB",
                                 operation, memory->resident_mb),
      });
    }
  } else {
    emit(Observation{
        .kind = ObservationKind::SamplingFailed,
        .operation = std::string{operation},
        .message = fmt::format("Memory sampling failed before {}: {}",
                               operation, memory.error().what),
    });
  }

  auto cpu = sampler_->cpu_snapshot(cfg_.cpu_sample_interval);
  if (cpu) {
    if (cpu->percent_total > cfg_.cpu_threshold_percent) {
      emit(Observation{
          .kind = ObservationKind::HighCpuBefore,
          .operation = std::string{operation},
          .value = cpu->percent_total,
          .threshold = cfg_.cpu_threshold_percent,
          .message = fmt::format("High CPU usage before {}: {:.1f}%",
                                 operation, cpu->percent_total),
      });
    }
  } else {
    emit(Observation{
        .kind = ObservationKind::SamplingFailed,
        .operation = std::string{operation},
        .message = fmt::format("CPU sampling failed before {}: {}", operation,
                               cpu.error().what),
    });
  }

  return baseline;
}

void ThresholdGuard::after_call(std::string_view operation,
                                std::optional<double> baseline_mb) const {
  if (!baseline_mb) {
    return;
  }

  auto memory = sampler_->memory_snapshot();
  if (!memory) {
    emit(Observation{
        .kind = ObservationKind::SamplingFailed,
        .operation = std::string{operation},
        .message = fmt::format("Memory sampling failed after {}: {}",
                               operation, memory.error().what),
    });
    return;
  }

  const double growth = memory->resident_mb - *baseline_mb;
  if (growth > cfg_.memory_growth_threshold_mb) {
    emit(Observation{
        .kind = ObservationKind::MemoryGrowth,
        .operation = std::string{operation},
        .value = growth,
        .threshold = cfg_.memory_growth_threshold_mb,
        .message = fmt::format("Function {} increased memory by {:.1f}MB",
                               operation, growth),
    });
  }
}

} // namespace opscope
