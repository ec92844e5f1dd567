#include "session.h"

#include <string>
#include <utility>

#include "debug.h"
#include "error.h"

namespace perftree {
namespace {

// Both backends fail with similar messages; prefix the one that failed.
PerftReport query_named(Engine& engine, const std::string& fen, const MovePath& moves,
                        int depth) {
  try {
    return engine.query(fen, moves, depth);
  } catch (const QueryError& ex) {
    throw QueryError(ex.kind(), std::string(engine.name()) + ": " + ex.what());
  }
}

}  // namespace

Session::Session(Engine& lhs, Engine& rhs) : lhs_(lhs), rhs_(rhs) {
  lhs_.set_chess960(chess960_);
  rhs_.set_chess960(chess960_);
}

void Session::set_fen(std::string fen) {
  fen_ = std::move(fen);
  moves_.clear();
  trace_emit(TraceTopic::Session, "fen " + fen_);
}

void Session::set_moves(MovePath moves) {
  moves_ = std::move(moves);
  trace_emit(TraceTopic::Session, "moves " + join_moves(moves_));
}

void Session::set_depth(int depth) {
  PERFTREE_ASSERT(depth >= 0);
  depth_ = depth;
}

void Session::goto_root() {
  moves_.clear();
}

void Session::goto_parent() {
  if (!moves_.empty()) {
    moves_.pop_back();
  }
}

void Session::goto_child(Move move) {
  moves_.push_back(std::move(move));
}

void Session::set_chess960(bool enabled) {
  chess960_ = enabled;
  lhs_.set_chess960(enabled);
  rhs_.set_chess960(enabled);
}

std::optional<int> Session::relative_depth() const {
  const auto played = static_cast<std::size_t>(depth_);
  if (moves_.size() > played) {
    return std::nullopt;
  }
  return static_cast<int>(played - moves_.size());
}

Diff Session::compare() {
  const auto relative = relative_depth();
  if (!relative) {
    throw UsageError("navigated path is already deeper than the requested target depth (" +
                     std::to_string(moves_.size()) + " moves played, depth " +
                     std::to_string(depth_) + ")");
  }
  trace_emit(TraceTopic::Session, "compare depth=" + std::to_string(depth_) +
                                      " relative=" + std::to_string(*relative));
  const PerftReport lhs = query_named(lhs_, fen_, moves_, *relative);
  const PerftReport rhs = query_named(rhs_, fen_, moves_, *relative);
  Diff diff = merge(lhs, rhs);
  trace_emit(TraceTopic::Session,
             "compare mismatched=" + std::to_string(diff.mismatch_count()));
  return diff;
}

}  // namespace perftree
