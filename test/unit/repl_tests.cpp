#include "repl.h"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

#include "debug.h"
#include "recording_engine.h"

namespace perftree::test {

namespace {

struct Harness {
  RecordingEngine lhs{"script"};
  RecordingEngine rhs{"engine"};
  Session session{lhs, rhs};
  std::ostringstream out;
  std::ostringstream err;
  ReplContext ctx{session, out, err, false, nullptr};

  bool run(std::string_view line) { return dispatch_command(ctx, line); }
};

}  // namespace

TEST_CASE("fen prints or replaces the base position", "[repl]") {
  Harness h;
  h.run("moves e2e4");
  h.run("fen");
  REQUIRE(h.out.str() == std::string(kStartPositionFen) + "\n");

  h.run("fen   4k3/8/8/8/8/8/8/4K3  w - - 0 1");
  REQUIRE(h.session.fen() == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
  REQUIRE(h.session.moves().empty());
}

TEST_CASE("moves prints or replaces the path", "[repl]") {
  Harness h;
  h.run("moves e2e4 e7e5");
  REQUIRE(h.session.moves() == MovePath{"e2e4", "e7e5"});
  h.run("moves");
  REQUIRE(h.out.str() == "e2e4 e7e5\n");
}

TEST_CASE("depth rejects non-numeric input and keeps the old value", "[repl]") {
  Harness h;
  h.run("depth 4");
  REQUIRE(h.session.depth() == 4);
  h.run("depth four");
  REQUIRE(h.session.depth() == 4);
  REQUIRE(h.err.str().find("cannot parse given depth") != std::string::npos);
  h.run("depth");
  REQUIRE(h.out.str() == "4\n");
}

TEST_CASE("depth above the limit names the limit", "[repl]") {
  Harness h;
  h.run("depth 1500");
  REQUIRE(h.session.depth() == kDefaultDepth);
  REQUIRE(h.err.str() == "depth 1500 exceeds 1000\n");
}

TEST_CASE("Navigation commands and their aliases", "[repl]") {
  Harness h;
  h.run("child e2e4");
  h.run("move e7e5");
  h.run("child g1f3");
  REQUIRE(h.session.moves() == MovePath{"e2e4", "e7e5", "g1f3"});
  h.run("parent");
  h.run("unmove");
  REQUIRE(h.session.moves() == MovePath{"e2e4"});
  h.run("root");
  REQUIRE(h.session.moves().empty());
  h.run("parent");
  REQUIRE(h.session.moves().empty());
  REQUIRE(h.err.str().empty());

  h.run("child");
  REQUIRE(h.err.str() == "missing argument, expected a child move\n");
}

TEST_CASE("diff renders the merged table", "[repl]") {
  Harness h;
  h.lhs.answer.total = 39;
  h.lhs.answer.children = {{"e2e3", 19}, {"e2e4", 20}};
  h.rhs.answer.total = 39;
  h.rhs.answer.children = {{"e2e3", 19}, {"e2e4", 20}};
  h.run("depth 2");
  h.run("child d2d4");
  h.run("diff");
  REQUIRE(h.out.str() == "e2e3  19  19\ne2e4  20  20\n\ntotal  39  39\n");
  REQUIRE(h.lhs.queries.back().depth == 1);
  REQUIRE(h.rhs.queries.back().moves == MovePath{"d2d4"});
}

TEST_CASE("diff reports failures without touching the session", "[repl]") {
  Harness h;
  h.rhs.failure = QueryFailure::Protocol;
  h.run("depth 3");
  h.run("moves e2e4 e7e5");
  h.run("diff");
  REQUIRE(h.err.str() == "cannot compute diff: engine: query failed\n");
  REQUIRE(h.out.str().empty());
  REQUIRE(h.session.moves() == MovePath{"e2e4", "e7e5"});

  h.err.str("");
  h.run("depth 1");
  h.run("diff");
  REQUIRE(h.err.str().rfind("cannot compute diff: navigated path is already deeper", 0) == 0);
}

TEST_CASE("chess960 toggles the variant flag", "[repl]") {
  Harness h;
  h.run("chess960");
  REQUIRE(h.session.chess960());
  REQUIRE(h.rhs.chess960);
  h.run("nochess960");
  REQUIRE_FALSE(h.session.chess960());
  REQUIRE_FALSE(h.rhs.chess960);
}

TEST_CASE("Unknown commands and blank lines keep the session alive", "[repl]") {
  Harness h;
  REQUIRE(h.run(""));
  REQUIRE(h.run("   "));
  REQUIRE(h.run("frobnicate"));
  REQUIRE(h.err.str() == "unknown command 'frobnicate'\n");
  REQUIRE_FALSE(h.run("quit"));
  REQUIRE_FALSE(h.run("exit"));
}

TEST_CASE("repl_feed stops at exit", "[repl]") {
  Harness h;
  repl_feed(h.ctx, "child e2e4\nchild e7e5\nexit\nchild g1f3\n");
  REQUIRE(h.session.moves() == MovePath{"e2e4", "e7e5"});
}

TEST_CASE("trace command toggles topics", "[repl][debug]") {
  Harness h;
  h.run("trace on session");
  REQUIRE(trace_enabled(TraceTopic::Session));
  h.run("trace status");
  REQUIRE(h.out.str().find("session=on") != std::string::npos);
  h.run("trace off session");
  REQUIRE_FALSE(trace_enabled(TraceTopic::Session));
  h.run("trace on nothing");
  REQUIRE(h.err.str() == "unknown trace topic 'nothing'\n");
}

}  // namespace perftree::test
