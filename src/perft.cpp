#include "perft.h"

#include "error.h"

namespace perftree {

void add_child_count(PerftReport& report, std::string_view move, NodeCount count) {
  auto [it, inserted] = report.children.emplace(std::string(move), count);
  if (!inserted) {
    throw QueryError(QueryFailure::Protocol, "move '" + it->first + "' reported twice");
  }
}

}  // namespace perftree
