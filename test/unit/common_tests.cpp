#include "common.h"

#include <catch2/catch.hpp>

namespace perftree::test {

TEST_CASE("parse_count accepts decimal digits only", "[common]") {
  REQUIRE(parse_count("400") == NodeCount{400});
  REQUIRE(parse_count("  0 ") == NodeCount{0});
  REQUIRE_FALSE(parse_count("").has_value());
  REQUIRE_FALSE(parse_count("-1").has_value());
  REQUIRE_FALSE(parse_count("+5").has_value());
  REQUIRE_FALSE(parse_count("12a").has_value());
  REQUIRE_FALSE(parse_count("1 2").has_value());
}

TEST_CASE("Counts beyond 64 bits survive parsing and formatting", "[common]") {
  // 2^64 and the largest 128-bit value.
  const std::string two_pow_64 = "18446744073709551616";
  const std::string max_128 = "340282366920938463463374607431768211455";
  const auto big = parse_count(two_pow_64);
  REQUIRE(big.has_value());
  REQUIRE(*big == (NodeCount{1} << 64));
  REQUIRE(format_count(*big) == two_pow_64);
  REQUIRE(format_count(*parse_count(max_128)) == max_128);
  REQUIRE_FALSE(parse_count("340282366920938463463374607431768211456").has_value());
}

TEST_CASE("decimal_digits counts rendered width", "[common]") {
  CHECK(decimal_digits(0) == 1);
  CHECK(decimal_digits(9) == 1);
  CHECK(decimal_digits(10) == 2);
  CHECK(decimal_digits(99) == 2);
  CHECK(decimal_digits(100) == 3);
  CHECK(decimal_digits(NodeCount{1} << 64) == 20);
}

TEST_CASE("Token helpers split on whitespace", "[common]") {
  std::string_view view = "  child   e2e4 ";
  REQUIRE(consume_token(view) == "child");
  REQUIRE(consume_token(view) == "e2e4");
  REQUIRE(consume_token(view).empty());

  const MovePath moves = split_whitespace("e2e4\te7e5  g1f3");
  REQUIRE(moves == MovePath{"e2e4", "e7e5", "g1f3"});
  REQUIRE(join_moves(moves) == "e2e4 e7e5 g1f3");
  REQUIRE(join_moves({}).empty());
}

}  // namespace perftree::test
