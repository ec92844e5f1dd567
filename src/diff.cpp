#include "diff.h"

#include <algorithm>

namespace perftree {

std::size_t Diff::mismatch_count() const {
  return static_cast<std::size_t>(std::count_if(
      rows.begin(), rows.end(), [](const auto& entry) { return entry.second.mismatch(); }));
}

Diff merge(const PerftReport& lhs, const PerftReport& rhs) {
  Diff diff;
  diff.total = {lhs.total, rhs.total};
  for (const auto& [move, count] : lhs.children) {
    diff.rows[move].lhs = count;
  }
  for (const auto& [move, count] : rhs.children) {
    diff.rows[move].rhs = count;
  }
  return diff;
}

}  // namespace perftree
