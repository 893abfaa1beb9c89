#pragma once
/// @file cache_info.hpp
/// @brief Cache configuration and introspection types.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace opscope {

/// @brief Bounds of one cache table.
struct CacheConfig {
  std::size_t capacity = 128; ///< Maximum entries; must be positive.
  /// Entry lifetime measured from insertion; nullopt = never expires.
  std::optional<std::chrono::nanoseconds> ttl = std::nullopt;
};

/// @brief Snapshot returned by InstrumentedCache::info().
struct CacheInfo {
  std::size_t size = 0;
  std::size_t capacity = 0;
  std::optional<std::chrono::nanoseconds> ttl;
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
};

} // namespace opscope
