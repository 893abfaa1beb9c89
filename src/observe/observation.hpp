#pragma once
/// @file observation.hpp
/// @brief Warning observations emitted by the monitoring wrappers, and the
///        library logger.

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace opscope {

/// @brief What a ThresholdGuard noticed around a wrapped call.
enum class ObservationKind : std::uint8_t {
  HighMemoryBefore, ///< Resident memory above threshold before the call.
  HighCpuBefore,    ///< CPU percent above threshold before the call.
  MemoryGrowth,     ///< Resident memory grew too much during the call.
  SamplingFailed,   ///< A resource query failed; the call still ran.
};

/// @brief Human-readable observation kind.
[[nodiscard]] constexpr auto to_string(ObservationKind k) -> const char * {
  switch (k) {
  case ObservationKind::HighMemoryBefore:
    return "high_memory_before";
  case ObservationKind::HighCpuBefore:
    return "high_cpu_before";
  case ObservationKind::MemoryGrowth:
    return "memory_growth";
  case ObservationKind::SamplingFailed:
    return "sampling_failed";
  }
  return "unknown";
}

/// @brief A single warning observation. Never alters the observed call.
struct Observation {
  ObservationKind kind;
  std::string operation; ///< Name of the wrapped operation.
  double value = 0.0;     ///< Offending measurement (MB or percent).
  double threshold = 0.0; ///< Threshold it was compared against.
  std::string message;    ///< Preformatted log line.
};

/// @brief Callback receiving observations.
using ObservationSink = std::function<void(const Observation &)>;

/// @brief Name under which the library logger is registered with spdlog.
inline constexpr const char *kLoggerName = "opscope";

/// @brief The library logger.
///
/// Returns the spdlog logger registered as "opscope", creating a stderr color
/// logger on first use. Applications may register their own logger under the
/// same name before the first call to redirect output.
[[nodiscard]] auto logger() -> std::shared_ptr<spdlog::logger>;

/// @brief Sink that logs every observation at warn level.
[[nodiscard]] auto log_sink() -> ObservationSink;

} // namespace opscope
