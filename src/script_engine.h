#pragma once
// script_engine.h -- Backend that runs the move generator under test once per query.
//
// The program is invoked as `<command> <depth> <fen> [<moves>]`, where the
// moves argument is a single space-joined string and is omitted for an empty
// path. Its stdout lists `<move> <count>` rows, a blank line, then the total.
// Its stderr is passed through untouched.

#include <iosfwd>
#include <string>
#include <string_view>

#include "perft.h"
#include "subprocess.h"

namespace perftree {

PerftReport parse_script_output(std::string_view text);

class ScriptEngine : public Engine {
 public:
  explicit ScriptEngine(std::string command, QueryLimits limits = {});

  PerftReport query(const std::string& fen, const MovePath& moves, int depth) override;

  [[nodiscard]] std::string_view name() const override { return command_; }

  // Sink for the script's stderr; nullptr restores std::cerr.
  void set_diagnostics(std::ostream* sink) { diagnostics_ = sink; }

 private:
  std::string command_;
  QueryLimits limits_;
  std::ostream* diagnostics_{nullptr};
};

}  // namespace perftree
