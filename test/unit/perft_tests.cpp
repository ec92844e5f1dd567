#include "perft.h"

#include <catch2/catch.hpp>

#include "error.h"

namespace perftree::test {

TEST_CASE("add_child_count records each move once", "[perft]") {
  PerftReport report;
  add_child_count(report, "e2e4", 20);
  add_child_count(report, "d2d4", 20);
  REQUIRE(report.children.size() == 2);
  REQUIRE(report.children.at("e2e4") == 20);
  REQUIRE(report.total == 0);
}

TEST_CASE("add_child_count rejects a repeated move", "[perft]") {
  PerftReport report;
  add_child_count(report, "e2e4", 20);
  try {
    add_child_count(report, "e2e4", 21);
    FAIL("duplicate move accepted");
  } catch (const QueryError& ex) {
    CHECK(ex.kind() == QueryFailure::Protocol);
  }
  REQUIRE(report.children.at("e2e4") == 20);
}

TEST_CASE("Engine defaults ignore the Chess960 flag", "[perft]") {
  struct Fixed : Engine {
    PerftReport query(const std::string&, const MovePath& moves, int depth) override {
      PerftReport out;
      out.total = static_cast<NodeCount>(moves.size() + static_cast<std::size_t>(depth));
      return out;
    }
    [[nodiscard]] std::string_view name() const override { return "fixed"; }
  };

  Fixed engine;
  Engine& base = engine;
  base.set_chess960(true);
  REQUIRE(base.query("fen", {"e2e4"}, 2).total == 3);
  REQUIRE(base.name() == "fixed");
}

TEST_CASE("error kinds have stable names", "[perft]") {
  CHECK(query_failure_name(QueryFailure::Transport) == "transport");
  CHECK(query_failure_name(QueryFailure::Protocol) == "protocol");
  CHECK(query_failure_name(QueryFailure::Timeout) == "timeout");
  CHECK(query_failure_name(QueryFailure::Cancelled) == "cancelled");
}

}  // namespace perftree::test
