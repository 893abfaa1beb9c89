/// @file cache_key.cpp
/// @brief Validation and serialization of cache keys.

#include "cache/cache_key.hpp"

#include <cmath>

namespace opscope {

namespace {

void validate(const nlohmann::json &j, const std::string &path) {
  switch (j.type()) {
  case nlohmann::json::value_t::number_float:
    // NaN != NaN, and dump() would print both NaN and Inf as null.
    if (!std::isfinite(j.get<double>())) {
      throw KeyDerivationError{"non-finite number at " + path};
    }
    break;
  case nlohmann::json::value_t::discarded:
    throw KeyDerivationError{"discarded value at " + path};
  case nlohmann::json::value_t::array:
    for (std::size_t i = 0; i < j.size(); ++i) {
      validate(j[i], path + "[" + std::to_string(i) + "]");
    }
    break;
  case nlohmann::json::value_t::object:
    for (const auto &[name, member] : j.items()) {
      validate(member, path + "." + name);
    }
    break;
  default:
    break;
  }
}

} // namespace

auto canonical_key(const nlohmann::json &encoded) -> std::string {
  validate(encoded, "args");
  try {
    return encoded.dump();
  } catch (const nlohmann::json::type_error &e) {
    // Invalid UTF-8 in a string argument.
    throw KeyDerivationError{e.what()};
  }
}

} // namespace opscope
