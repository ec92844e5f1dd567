#include "options.h"

#include <charconv>
#include <string>
#include <system_error>

namespace perftree {
namespace {

constexpr std::string_view kUsage =
    "Usage: perftree [options] <script>\n"
    "\n"
    "  <script>              program run as `<script> <depth> <fen> [<moves>]`\n"
    "  -e, --engine PROGRAM  reference UCI engine on PATH (default: stockfish)\n"
    "  -t, --timeout MS      fail a query after MS milliseconds (default: 0, wait)\n"
    "  -f, --fen FEN         initial base position\n"
    "  -d, --depth N         initial target depth (default: 1)\n"
    "      --trace TOPIC     enable tracing: process|engine|script|session|all\n"
    "      --color WHEN      auto|always|never (default: auto)\n"
    "  -h, --help            show this message\n";

std::optional<std::int64_t> parse_int(std::string_view token) {
  std::int64_t value = 0;
  const auto* begin = token.data();
  const auto* end = begin + token.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec == std::errc{} && ptr == end) {
    return value;
  }
  return std::nullopt;
}

}  // namespace

std::string_view usage_text() {
  return kUsage;
}

bool resolve_color(ColorMode mode, bool terminal, const char* term, const char* no_color) {
  switch (mode) {
    case ColorMode::Always:
      return true;
    case ColorMode::Never:
      return false;
    case ColorMode::Auto:
      break;
  }
  if (no_color && *no_color != '\0') {
    return false;
  }
  return terminal && !(term && std::string_view(term) == "dumb");
}

std::optional<int> parse_depth(std::string_view token) {
  const auto value = parse_int(token);
  if (!value || *value < 0 || *value > kMaxDepth) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::string depth_error(std::string_view token) {
  const auto value = parse_int(token);
  if (value && *value > kMaxDepth) {
    return "depth " + std::string(token) + " exceeds " + std::to_string(kMaxDepth);
  }
  return "cannot parse given depth: '" + std::string(token) + "'";
}

std::optional<Options> parse_options(int argc, const char* const argv[], std::string& error) {
  Options opt;
  error.clear();
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const auto next_value = [&]() -> std::optional<std::string_view> {
      if (i + 1 >= argc) {
        error = "missing value for " + std::string(arg);
        return std::nullopt;
      }
      return std::string_view(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      opt.help = true;
    } else if (arg == "-e" || arg == "--engine") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      opt.engine = std::string(*value);
    } else if (arg == "-t" || arg == "--timeout") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      const auto ms = parse_int(*value);
      if (!ms || *ms < 0) {
        error = "invalid timeout '" + std::string(*value) + "'";
        return std::nullopt;
      }
      opt.timeout = std::chrono::milliseconds(*ms);
    } else if (arg == "-f" || arg == "--fen") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      opt.fen = std::string(*value);
    } else if (arg == "-d" || arg == "--depth") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      opt.depth = parse_depth(*value);
      if (!opt.depth) {
        error = depth_error(*value);
        return std::nullopt;
      }
    } else if (arg == "--trace") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      if (*value == "all") {
        for (int idx = 0; idx < static_cast<int>(TraceTopic::Count); ++idx) {
          opt.trace.push_back(static_cast<TraceTopic>(idx));
        }
      } else if (const auto topic = trace_topic_from_string(*value)) {
        opt.trace.push_back(*topic);
      } else {
        error = "unknown trace topic '" + std::string(*value) + "'";
        return std::nullopt;
      }
    } else if (arg == "--color") {
      const auto value = next_value();
      if (!value) {
        return std::nullopt;
      }
      if (*value == "auto") {
        opt.color = ColorMode::Auto;
      } else if (*value == "always") {
        opt.color = ColorMode::Always;
      } else if (*value == "never") {
        opt.color = ColorMode::Never;
      } else {
        error = "invalid color mode '" + std::string(*value) + "'";
        return std::nullopt;
      }
    } else if (arg.size() > 1 && arg.front() == '-') {
      error = "unknown option '" + std::string(arg) + "'";
      return std::nullopt;
    } else if (opt.script.empty()) {
      opt.script = std::string(arg);
    } else {
      error = "unexpected argument '" + std::string(arg) + "'";
      return std::nullopt;
    }
  }

  if (opt.script.empty() && !opt.help) {
    error = "missing script argument";
    return std::nullopt;
  }
  return opt;
}

}  // namespace perftree
