#pragma once
// render.h -- Aligned, optionally coloured table of a Diff.

#include <iosfwd>

#include "diff.h"

namespace perftree {

/**
 * One line per move (`<move>  <lhs>  <rhs>`, counts right-aligned to the
 * widest per-move count), a blank line, then `total  <lhs>  <rhs>`. Rows
 * whose sides differ are printed bold red when `color` is set.
 */
void write_diff(std::ostream& out, const Diff& diff, bool color);

int count_column_width(const Diff& diff);

}  // namespace perftree
