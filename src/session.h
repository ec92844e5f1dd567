#pragma once
/**
 * @file session.h
 * @brief The position under inspection and the comparison it drives.
 *
 * A session is fully described by a base FEN, the moves played from it, the
 * target depth counted from the base, and the Chess960 flag. Queries are sent
 * at the relative depth, i.e. the target depth minus the path length. Every
 * transition is plain bookkeeping: nothing is validated against chess rules,
 * and a failed comparison leaves the state exactly as it was.
 */

#include <optional>
#include <string>

#include "common.h"
#include "diff.h"
#include "perft.h"

namespace perftree {

inline constexpr int kDefaultDepth = 1;

class Session {
 public:
  /** `lhs` is the generator under test, `rhs` the reference engine. */
  Session(Engine& lhs, Engine& rhs);

  [[nodiscard]] const std::string& fen() const noexcept { return fen_; }
  [[nodiscard]] const MovePath& moves() const noexcept { return moves_; }
  [[nodiscard]] int depth() const noexcept { return depth_; }
  [[nodiscard]] bool chess960() const noexcept { return chess960_; }

  void set_fen(std::string fen);
  void set_moves(MovePath moves);
  void set_depth(int depth);
  void goto_root();
  void goto_parent();
  void goto_child(Move move);
  void set_chess960(bool enabled);

  /** Empty when the path is already longer than the target depth. */
  [[nodiscard]] std::optional<int> relative_depth() const;

  /**
   * Query both engines at the current position and merge their answers.
   * Throws `UsageError` on depth underflow and propagates `QueryError`.
   */
  Diff compare();

 private:
  Engine& lhs_;
  Engine& rhs_;
  std::string fen_{kStartPositionFen};
  MovePath moves_;
  int depth_{kDefaultDepth};
  bool chess960_{false};
};

}  // namespace perftree
