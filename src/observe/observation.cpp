/// @file observation.cpp
/// @brief Library logger and the default observation sink.

#include "observe/observation.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace opscope {

auto logger() -> std::shared_ptr<spdlog::logger> {
  // spdlog throws on duplicate registration, so creation is serialized.
  static std::mutex create_mutex;
  std::lock_guard lock(create_mutex);
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  return spdlog::stderr_color_mt(kLoggerName);
}

auto log_sink() -> ObservationSink {
  return [](const Observation &obs) {
    logger()->warn("[{}] {}: {}", obs.operation, to_string(obs.kind),
                   obs.message);
  };
}

} // namespace opscope
