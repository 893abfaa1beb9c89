/// @file memory_reclaimer.cpp
/// @brief Implementation of MemoryReclaimer.

#include "sampler/memory_reclaimer.hpp"

#include <utility>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace opscope {

auto MemoryReclaimer::reclaim() const -> std::expected<double, SamplingError> {
  auto before = sampler_.memory_snapshot();
  if (!before) {
    return std::unexpected(std::move(before.error()));
  }

#if defined(__GLIBC__)
  ::malloc_trim(0);
#endif

  auto after = sampler_.memory_snapshot();
  if (!after) {
    return std::unexpected(std::move(after.error()));
  }
  return before->resident_mb - after->resident_mb;
}

} // namespace opscope
