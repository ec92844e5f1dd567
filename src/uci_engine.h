#pragma once
/**
 * @file uci_engine.h
 * @brief Reference backend: one long-lived UCI engine spoken to over pipes.
 *
 * Every query sends the Chess960 option, the position and `go perft <depth>`,
 * then reads `<move>: <count>` rows up to a blank line, a labelled total line
 * and one trailing separator line. The conversation is strictly sequential;
 * after any failure the stream position is unknown, so the child is killed
 * and a fresh one is started on the next query.
 */

#include <functional>
#include <string>
#include <string_view>

#include "perft.h"
#include "subprocess.h"

namespace perftree {

inline constexpr std::string_view kDefaultUciEngine = "stockfish";

/** Produces the next response line; throws `QueryError` when none is left. */
using LineSource = std::function<std::string()>;

PerftReport parse_uci_perft(const LineSource& next_line);
PerftReport parse_uci_perft(std::string_view response);

class UciEngine : public Engine {
 public:
  /** Spawns the engine and consumes its banner; throws `QueryError` on failure. */
  explicit UciEngine(std::string program = std::string(kDefaultUciEngine),
                     QueryLimits limits = {});

  ~UciEngine() override;
  UciEngine(const UciEngine&) = delete;
  UciEngine& operator=(const UciEngine&) = delete;

  PerftReport query(const std::string& fen, const MovePath& moves, int depth) override;

  void set_chess960(bool enabled) override { chess960_ = enabled; }
  [[nodiscard]] bool chess960() const noexcept { return chess960_; }

  [[nodiscard]] std::string_view name() const override { return program_; }
  [[nodiscard]] bool running() const noexcept { return child_.running(); }
  [[nodiscard]] pid_t pid() const noexcept { return child_.pid(); }
  [[nodiscard]] const std::string& banner() const noexcept { return banner_; }

 private:
  void start();
  void send(const std::string& lines);
  std::string receive(const Deadline& deadline);

  std::string program_;
  QueryLimits limits_;
  Subprocess child_;
  std::string banner_;
  bool chess960_{false};
};

}  // namespace perftree
