#pragma once
/// @file memory_reclaimer.hpp
/// @brief Explicit memory-reclamation hint.

#include "sampler/resource_sampler.hpp"

namespace opscope {

/// @brief Asks the allocator to hand free heap pages back to the OS.
///
/// On glibc this is malloc_trim(0); elsewhere the hint is a no-op. The
/// reclaimer measures resident memory before and after through the sampler.
class MemoryReclaimer {
public:
  explicit MemoryReclaimer(const ResourceSampler &sampler) noexcept
      : sampler_{sampler} {}

  /// @brief Issue the hint.
  /// @return Resident MB released (may be 0 or negative under concurrent
  ///         allocation), or the sampling failure.
  auto reclaim() const -> std::expected<double, SamplingError>;

private:
  const ResourceSampler &sampler_;
};

} // namespace opscope
