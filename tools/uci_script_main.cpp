// uci_script_main.cpp -- Exposes a UCI engine through the script protocol.
// Usage: perftree-uci-script [--engine PROGRAM] [--chess960] <depth> <fen> [<moves>]
// Lets a second UCI engine stand in for the generator under test.

#include "error.h"
#include "options.h"
#include "uci_engine.h"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct ToolOptions {
  std::string engine{perftree::kDefaultUciEngine};
  bool chess960{false};
  std::vector<std::string> positional;
};

ToolOptions parse(int argc, char** argv) {
  ToolOptions opt;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if ((arg == "-e" || arg == "--engine") && i + 1 < argc) {
      opt.engine = argv[++i];
    } else if (arg == "--chess960") {
      opt.chess960 = true;
    } else {
      opt.positional.emplace_back(arg);
    }
  }
  return opt;
}

}  // namespace

int main(int argc, char** argv) {
  const ToolOptions options = parse(argc, argv);
  if (options.positional.size() < 2 || options.positional.size() > 3) {
    std::cerr << "Usage: perftree-uci-script [--engine PROGRAM] [--chess960] <depth> <fen> "
                 "[<moves>]\n";
    return 1;
  }
  const auto depth = perftree::parse_depth(options.positional[0]);
  if (!depth) {
    std::cerr << "perftree-uci-script: " << perftree::depth_error(options.positional[0]) << "\n";
    return 1;
  }
  const perftree::MovePath moves = options.positional.size() == 3
                                       ? perftree::split_whitespace(options.positional[2])
                                       : perftree::MovePath{};

  try {
    perftree::UciEngine engine(options.engine);
    engine.set_chess960(options.chess960);
    const perftree::PerftReport report = engine.query(options.positional[1], moves, *depth);
    for (const auto& [move, count] : report.children) {
      std::cout << move << ' ' << perftree::format_count(count) << "\n";
    }
    std::cout << "\n" << perftree::format_count(report.total) << "\n";
  } catch (const perftree::QueryError& ex) {
    std::cerr << "perftree-uci-script: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
