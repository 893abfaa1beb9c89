#pragma once
/// @file cache_key.hpp
/// @brief Deterministic cache keys from call arguments.
///
/// A key is the canonical JSON text of the positional argument list. Each
/// argument is converted with nlohmann::json's ADL serializer, so any type
/// with a to_json() overload can be cached. NamedArgs encodes as a JSON
/// object whose members are sorted by name: named arguments are
/// order-independent, positional ones are not.

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace opscope {

/// @brief Arguments that cannot be encoded into a stable key.
///
/// Thrown before the wrapped operation runs.
class KeyDerivationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// @brief Keyword-style arguments. Member order never affects the key.
using NamedArgs = std::map<std::string, nlohmann::json>;

/// @brief Convert one argument to its key representation.
template <typename T> auto encode_argument(const T &value) -> nlohmann::json {
  static_assert(!std::is_pointer_v<std::decay_t<T>>,
                "pointer arguments have no stable structural equality");
  return nlohmann::json(value);
}

/// @brief Serialize an encoded argument list.
/// @throws KeyDerivationError if any value is a non-finite float, a
///         discarded value, or a string that is not valid UTF-8.
[[nodiscard]] auto canonical_key(const nlohmann::json &encoded) -> std::string;

/// @brief Derive the cache key for a call with @p args.
template <typename... Args>
[[nodiscard]] auto derive_key(const Args &...args) -> std::string {
  auto encoded = nlohmann::json::array();
  (encoded.push_back(encode_argument(args)), ...);
  return canonical_key(encoded);
}

} // namespace opscope
