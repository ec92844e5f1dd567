#pragma once
// diff.h -- Move-by-move merge of two perft reports.

#include <cstddef>
#include <map>
#include <optional>
#include <utility>

#include "common.h"
#include "perft.h"

namespace perftree {

/** Counts for one move; an empty side means that backend did not list the move. */
struct DiffRow {
  std::optional<NodeCount> lhs;
  std::optional<NodeCount> rhs;

  [[nodiscard]] bool mismatch() const { return lhs != rhs; }
};

struct Diff {
  std::pair<NodeCount, NodeCount> total{0, 0};
  std::map<Move, DiffRow> rows;  // ordered by move name

  [[nodiscard]] bool total_mismatch() const { return total.first != total.second; }
  [[nodiscard]] std::size_t mismatch_count() const;
};

/**
 * Union of both reports' moves. Totals are copied as reported and never
 * recomputed from the rows.
 */
Diff merge(const PerftReport& lhs, const PerftReport& rhs);

}  // namespace perftree
