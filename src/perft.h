#pragma once
// perft.h -- Per-move node counts and the query contract both backends implement.

#include <map>
#include <string>
#include <string_view>

#include "common.h"

namespace perftree {

/** One backend's answer to one query: the total and a count per legal move. */
struct PerftReport {
  NodeCount total{0};
  std::map<Move, NodeCount> children;
};

/**
 * Record one child row. A backend naming the same move twice in one answer
 * is a protocol violation.
 */
void add_child_count(PerftReport& report, std::string_view move, NodeCount count);

/**
 * Source of perft counts. `query` enumerates the legal moves at `fen` after
 * playing `moves` and counts each subtree `depth` plies deep. Implementations
 * throw `QueryError` on failure.
 */
class Engine {
 public:
  virtual ~Engine() = default;

  virtual PerftReport query(const std::string& fen, const MovePath& moves, int depth) = 0;

  // Only the persistent engine understands the Chess960 castling notation.
  virtual void set_chess960(bool enabled) { (void)enabled; }

  [[nodiscard]] virtual std::string_view name() const = 0;
};

}  // namespace perftree
