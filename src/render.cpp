#include "render.h"

#include <algorithm>
#include <ostream>
#include <string>

#include <fmt/color.h>
#include <fmt/format.h>

namespace perftree {
namespace {

std::string count_cell(const std::optional<NodeCount>& count, int width) {
  return fmt::format("  {:>{}}", count ? format_count(*count) : std::string{}, width);
}

void emit_line(std::ostream& out, const std::string& text, bool highlight, bool color) {
  if (highlight && color) {
    out << fmt::format(fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red), "{}", text);
  } else {
    out << text;
  }
  out << '\n';
}

}  // namespace

int count_column_width(const Diff& diff) {
  int width = 0;
  for (const auto& [move, row] : diff.rows) {
    if (row.lhs) {
      width = std::max(width, decimal_digits(*row.lhs));
    }
    if (row.rhs) {
      width = std::max(width, decimal_digits(*row.rhs));
    }
  }
  return width;
}

void write_diff(std::ostream& out, const Diff& diff, bool color) {
  const int width = count_column_width(diff);
  for (const auto& [move, row] : diff.rows) {
    const std::string text = move + count_cell(row.lhs, width) + count_cell(row.rhs, width);
    emit_line(out, text, row.mismatch(), color);
  }

  out << '\n';
  const std::string total = fmt::format("total  {}  {}", format_count(diff.total.first),
                                        format_count(diff.total.second));
  emit_line(out, total, diff.total_mismatch(), color);
  out.flush();
}

}  // namespace perftree
