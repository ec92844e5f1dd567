#pragma once
// common.h -- Shared primitive types, count helpers, and debug helpers.
// Defines lightweight utilities used across the tool. Keep implementation
// details in the corresponding translation unit when possible.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace perftree {

// Perft counts overflow 64 bits around depth 13 from busy positions.
using NodeCount = unsigned __int128;

using Move = std::string;
using MovePath = std::vector<Move>;

inline constexpr std::string_view kStartPositionFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

std::optional<NodeCount> parse_count(std::string_view token);
std::string format_count(NodeCount value);
int decimal_digits(NodeCount value);

std::string join_moves(const MovePath& moves);

std::string_view trim_view(std::string_view sv);
std::string consume_token(std::string_view& view);
std::vector<std::string> split_whitespace(std::string_view view);

namespace detail {
[[noreturn]] void perftree_trap(const char* expr, const char* file, int line);
}  // namespace detail

}  // namespace perftree

#ifdef NDEBUG
#define PERFTREE_ASSERT(expr) do { (void)sizeof(expr); } while (false)
#else
#define PERFTREE_ASSERT(expr)                                                     \
  do {                                                                            \
    if (!(expr)) {                                                                \
      ::perftree::detail::perftree_trap(#expr, __FILE__, __LINE__);               \
    }                                                                             \
  } while (false)
#endif
