#include "common.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace perftree {

namespace {

bool is_space(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

std::optional<NodeCount> parse_count(std::string_view token) {
  token = trim_view(token);
  if (token.empty()) {
    return std::nullopt;
  }
  constexpr NodeCount kMax = ~NodeCount{0};
  NodeCount value = 0;
  for (const char ch : token) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    const auto digit = static_cast<unsigned>(ch - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

std::string format_count(NodeCount value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

int decimal_digits(NodeCount value) {
  int digits = 1;
  while (value >= 10) {
    value /= 10;
    ++digits;
  }
  return digits;
}

std::string join_moves(const MovePath& moves) {
  std::string out;
  for (std::size_t idx = 0; idx < moves.size(); ++idx) {
    if (idx > 0) {
      out.push_back(' ');
    }
    out += moves[idx];
  }
  return out;
}

std::string_view trim_view(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && is_space(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

std::string consume_token(std::string_view& view) {
  view = trim_view(view);
  std::size_t idx = 0;
  while (idx < view.size() && !is_space(view[idx])) {
    ++idx;
  }
  std::string token(view.substr(0, idx));
  view.remove_prefix(idx);
  view = trim_view(view);
  return token;
}

std::vector<std::string> split_whitespace(std::string_view view) {
  std::vector<std::string> tokens;
  while (true) {
    std::string token = consume_token(view);
    if (token.empty()) {
      break;
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

namespace detail {

[[noreturn]] void perftree_trap(const char* expr, const char* file, int line) {
  std::cerr << "perftree assertion failed: " << expr << " (" << file << ':' << line << ")\n";
  std::abort();
}

}  // namespace detail

}  // namespace perftree
