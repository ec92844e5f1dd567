#include <iostream>
#include <string>

#include "options.h"
#include "repl.h"

int main(int argc, const char* argv[]) {
  std::string error;
  const auto options = perftree::parse_options(argc, argv, error);
  if (!options) {
    std::cerr << "perftree: " << error << "\n\n" << perftree::usage_text();
    return 1;
  }
  if (options->help) {
    std::cout << perftree::usage_text();
    return 0;
  }
  return perftree::repl_main(*options);
}
