#pragma once
// options.h -- Command-line configuration for a perftree session.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "debug.h"

namespace perftree {

enum class ColorMode : std::uint8_t { Auto = 0, Always, Never };

struct Options {
  std::string script;
  std::string engine{"stockfish"};
  std::chrono::milliseconds timeout{0};
  std::string fen;
  std::optional<int> depth;
  std::vector<TraceTopic> trace;
  ColorMode color{ColorMode::Auto};
  bool help{false};
};

/** Parses `argv[1..]`; on failure returns nullopt and fills `error`. */
std::optional<Options> parse_options(int argc, const char* const argv[], std::string& error);

std::string_view usage_text();

/**
 * Whether diff output is highlighted. `Auto` colours a terminal unless
 * `TERM` is `dumb` or `NO_COLOR` is set to a non-empty value; either
 * variable may be nullptr when unset.
 */
bool resolve_color(ColorMode mode, bool terminal, const char* term, const char* no_color);

inline constexpr int kMaxDepth = 1000;

/** A depth in `[0, kMaxDepth]`, or nullopt. */
std::optional<int> parse_depth(std::string_view token);

/** Message for a token `parse_depth` rejected. */
std::string depth_error(std::string_view token);

}  // namespace perftree
