#pragma once
/// @file batch_executor.hpp
/// @brief Chunked execution of operations over ordered input.

#include "interface/operation.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace opscope {

/// @brief Batching parameters.
struct BatchConfig {
  std::size_t batch_size = 100; ///< Maximum elements per chunk; positive.
  std::size_t reclaim_every = 10; ///< Hint after chunk 0, N, 2N, ...
};

/// @brief Invoked at reclamation points between chunks.
using ReclaimHook = std::function<void()>;

template <typename T> struct is_sequence : std::false_type {};
template <typename T, typename A>
struct is_sequence<std::vector<T, A>> : std::true_type {};

/// @brief True for the ordered sequence types BatchExecutor splits.
template <typename T>
inline constexpr bool is_sequence_v = is_sequence<std::remove_cvref_t<T>>::value;

/// @brief Split @p input into consecutive chunks of at most @p size elements.
/// @throws std::invalid_argument if @p size is 0.
template <typename T, typename A>
auto chunk(const std::vector<T, A> &input, std::size_t size)
    -> std::vector<std::vector<T, A>> {
  if (size == 0) {
    throw std::invalid_argument{"chunk size must be positive"};
  }
  std::vector<std::vector<T, A>> chunks;
  chunks.reserve((input.size() + size - 1) / size);
  for (std::size_t start = 0; start < input.size(); start += size) {
    const auto end = std::min(input.size(), start + size);
    chunks.emplace_back(input.begin() + static_cast<std::ptrdiff_t>(start),
                        input.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return chunks;
}

/// @brief Runs an operation once per chunk of its sequence argument.
///
/// Chunk results are concatenated in chunk order when they are sequences and
/// collected one per chunk otherwise, so a batched call over a sequence is
/// equivalent to one unbatched call. Non-sequence input passes straight
/// through. Extra arguments after the sequence are handed to every chunk.
class BatchExecutor {
public:
  /// @param cfg     Chunking parameters.
  /// @param reclaim Memory-reclamation hint; may be empty.
  /// @throws std::invalid_argument if cfg.batch_size is 0.
  explicit BatchExecutor(BatchConfig cfg, ReclaimHook reclaim = {})
      : cfg_{validated(cfg)}, reclaim_{std::move(reclaim)} {}

  template <typename Result, typename Input, typename... Extra>
  auto wrap(Operation<Result(Input, Extra...)> op) const {
    if constexpr (!is_sequence_v<Input>) {
      return op;
    } else {
      using Chunk = std::remove_cvref_t<Input>;
      using Output =
          std::conditional_t<is_sequence_v<Result>, std::remove_cvref_t<Result>,
                             std::vector<std::remove_cvref_t<Result>>>;
      static_assert(!std::is_void_v<Result>,
                    "batched operations must return a value per chunk");
      static_assert(!std::is_lvalue_reference_v<Input> ||
                        std::is_const_v<std::remove_reference_t<Input>>,
                    "chunks are temporaries; take the sequence by value or "
                    "const reference");

      return Operation<Output(Input, Extra...)>{
          [exec = *this, op = std::move(op)](Input input,
                                             Extra... extra) -> Output {
            const Chunk &items = input;
            const std::size_t size = exec.cfg_.batch_size;
            Output out;
            std::size_t index = 0;
            for (std::size_t start = 0; start < items.size();
                 start += size, ++index) {
              const auto end = std::min(items.size(), start + size);
              Chunk piece(items.begin() + static_cast<std::ptrdiff_t>(start),
                          items.begin() + static_cast<std::ptrdiff_t>(end));

              auto part = [&]() -> decltype(auto) {
                if constexpr (std::is_reference_v<Input>) {
                  return std::invoke(op, piece, extra...);
                } else {
                  return std::invoke(op, std::move(piece), extra...);
                }
              }();

              if constexpr (is_sequence_v<Result>) {
                out.insert(out.end(), std::make_move_iterator(part.begin()),
                           std::make_move_iterator(part.end()));
              } else {
                out.push_back(std::move(part));
              }

              exec.maybe_reclaim(index);
            }
            return out;
          }};
    }
  }

  [[nodiscard]] auto config() const noexcept -> const BatchConfig & {
    return cfg_;
  }

private:
  static auto validated(BatchConfig cfg) -> BatchConfig {
    if (cfg.batch_size == 0) {
      throw std::invalid_argument{"batch size must be positive"};
    }
    return cfg;
  }

  void maybe_reclaim(std::size_t chunk_index) const {
    if (reclaim_ && cfg_.reclaim_every > 0 &&
        chunk_index % cfg_.reclaim_every == 0) {
      reclaim_();
    }
  }

  BatchConfig cfg_;
  ReclaimHook reclaim_;
};

} // namespace opscope
