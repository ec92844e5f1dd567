#include "script_engine.h"

#include <iostream>
#include <optional>
#include <utility>
#include <vector>

#include "debug.h"
#include "error.h"

namespace perftree {
namespace {

class LineCursor {
 public:
  explicit LineCursor(std::string_view text) : rest_(text) {}

  std::optional<std::string_view> next() {
    if (rest_.empty()) {
      return std::nullopt;
    }
    const auto newline = rest_.find('\n');
    std::string_view line = rest_.substr(0, newline);
    rest_.remove_prefix(newline == std::string_view::npos ? rest_.size() : newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    return line;
  }

 private:
  std::string_view rest_;
};

[[noreturn]] void protocol_failure(const std::string& message) {
  throw QueryError(QueryFailure::Protocol, message);
}

}  // namespace

PerftReport parse_script_output(std::string_view text) {
  LineCursor cursor(text);
  PerftReport report;

  while (true) {
    const auto line = cursor.next();
    if (!line) {
      protocol_failure("unexpected eof while parsing script output");
    }
    std::string_view view = trim_view(*line);
    if (view.empty()) {
      break;
    }
    const std::string move = consume_token(view);
    const std::string count_token = consume_token(view);
    if (count_token.empty()) {
      protocol_failure("unexpected end of line '" + std::string(*line) +
                       "'; expected move and count separated by spaces");
    }
    const auto count = parse_count(count_token);
    if (!count) {
      protocol_failure("invalid count '" + count_token + "' for move " + move);
    }
    add_child_count(report, move, *count);
  }

  const auto total_line = cursor.next();
  if (!total_line) {
    protocol_failure("unexpected eof while parsing script output; expected total count");
  }
  const auto total = parse_count(*total_line);
  if (!total) {
    protocol_failure("invalid total count '" + std::string(trim_view(*total_line)) + "'");
  }
  report.total = *total;
  return report;
}

ScriptEngine::ScriptEngine(std::string command, QueryLimits limits)
    : command_(std::move(command)), limits_(limits) {}

PerftReport ScriptEngine::query(const std::string& fen, const MovePath& moves, int depth) {
  std::vector<std::string> argv{command_, std::to_string(depth), fen};
  if (!moves.empty()) {
    argv.push_back(join_moves(moves));
  }

  Stdio stdio;
  stdio.in = StreamMode::Null;
  stdio.out = StreamMode::Pipe;
  stdio.err = StreamMode::Pipe;
  Subprocess child = Subprocess::spawn(argv, stdio);
  const CapturedOutput captured =
      child.communicate(Deadline::after(limits_.timeout), limits_.cancel);

  std::ostream& diagnostics = diagnostics_ ? *diagnostics_ : std::cerr;
  diagnostics << captured.err;
  diagnostics.flush();

  trace_emit(TraceTopic::Script, "depth=" + std::to_string(depth) +
                                     " status=" + std::to_string(captured.exit_status) +
                                     " stdout_bytes=" + std::to_string(captured.out.size()) +
                                     " stderr_bytes=" + std::to_string(captured.err.size()));

  try {
    return parse_script_output(captured.out);
  } catch (const QueryError& ex) {
    if (captured.exit_status == 0) {
      throw;
    }
    throw QueryError(ex.kind(), std::string(ex.what()) + " (script exited with status " +
                                    std::to_string(captured.exit_status) + ")");
  }
}

}  // namespace perftree
