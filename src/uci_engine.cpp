#include "uci_engine.h"

#include <chrono>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include "debug.h"
#include "error.h"

namespace perftree {
namespace {

constexpr std::string_view kFieldSeparator = ": ";
constexpr std::chrono::milliseconds kQuitGrace{100};

[[noreturn]] void protocol_failure(const std::string& message) {
  throw QueryError(QueryFailure::Protocol, message);
}

std::vector<std::string_view> split_fields(std::string_view line) {
  std::vector<std::string_view> fields;
  while (true) {
    const auto pos = line.find(kFieldSeparator);
    if (pos == std::string_view::npos) {
      fields.push_back(line);
      return fields;
    }
    fields.push_back(line.substr(0, pos));
    line.remove_prefix(pos + kFieldSeparator.size());
  }
}

bool is_info_line(std::string_view line) {
  return line == "info" || line.rfind("info ", 0) == 0;
}

}  // namespace

PerftReport parse_uci_perft(const LineSource& next_line) {
  PerftReport report;

  bool seen_row = false;
  while (true) {
    const std::string raw = next_line();
    const std::string_view line = trim_view(raw);
    if (line.empty()) {
      break;
    }
    if (!seen_row && is_info_line(line)) {
      continue;
    }
    const auto split = line.find(kFieldSeparator);
    if (split == std::string_view::npos) {
      protocol_failure("unexpected end of line '" + std::string(line) +
                       "'; expected '<move>: <count>'");
    }
    const std::string_view move = line.substr(0, split);
    const std::string_view count_token = line.substr(split + kFieldSeparator.size());
    const auto count = parse_count(count_token);
    if (move.empty() || !count) {
      protocol_failure("malformed move row '" + std::string(line) + "'");
    }
    add_child_count(report, move, *count);
    seen_row = true;
  }

  const std::string raw_total = next_line();
  const auto fields = split_fields(trim_view(raw_total));
  if (fields.size() < 2) {
    protocol_failure("unexpected end of line '" + raw_total + "'; expected labelled total");
  }
  const auto total = parse_count(fields.back());
  if (!total) {
    protocol_failure("invalid total count '" + std::string(fields.back()) + "'");
  }
  report.total = *total;

  // Trailing separator keeps the stream aligned for the next query.
  (void)next_line();
  return report;
}

PerftReport parse_uci_perft(std::string_view response) {
  std::istringstream input{std::string(response)};
  return parse_uci_perft([&input]() {
    std::string line;
    if (!std::getline(input, line)) {
      protocol_failure("unexpected end of engine response");
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  });
}

UciEngine::UciEngine(std::string program, QueryLimits limits)
    : program_(std::move(program)), limits_(limits) {
  start();
}

UciEngine::~UciEngine() {
  if (!child_.running()) {
    return;
  }
  try {
    child_.write("quit\n");
  } catch (const QueryError& ex) {
    trace_emit(TraceTopic::Engine, std::string("quit not delivered: ") + ex.what());
  }
  child_.close_stdin();
  const auto give_up = std::chrono::steady_clock::now() + kQuitGrace;
  while (child_.alive() && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  child_.terminate();
}

void UciEngine::start() {
  Stdio stdio;
  stdio.in = StreamMode::Pipe;
  stdio.out = StreamMode::Pipe;
  stdio.err = StreamMode::Inherit;
  child_ = Subprocess::spawn({program_}, stdio);
  try {
    banner_ = receive(Deadline::after(limits_.timeout));
  } catch (const QueryError&) {
    child_.terminate();
    throw;
  }
}

void UciEngine::send(const std::string& lines) {
  if (trace_enabled(TraceTopic::Engine)) {
    std::istringstream split(lines);
    std::string line;
    while (std::getline(split, line)) {
      trace_emit(TraceTopic::Engine, ">> " + line);
    }
  }
  child_.write(lines);
}

std::string UciEngine::receive(const Deadline& deadline) {
  std::string line = child_.read_line(deadline, limits_.cancel);
  trace_emit(TraceTopic::Engine, "<< " + line);
  return line;
}

PerftReport UciEngine::query(const std::string& fen, const MovePath& moves, int depth) {
  if (!child_.alive()) {
    trace_emit(TraceTopic::Engine, "respawn " + program_);
    start();
  }

  std::ostringstream request;
  request << "setoption name UCI_Chess960 value " << (chess960_ ? "true" : "false") << '\n';
  request << "position fen " << fen;
  if (!moves.empty()) {
    request << " moves " << join_moves(moves);
  }
  request << '\n';
  request << "go perft " << depth << '\n';

  try {
    send(request.str());
    const Deadline deadline = Deadline::after(limits_.timeout);
    return parse_uci_perft([this, &deadline]() { return receive(deadline); });
  } catch (const QueryError& ex) {
    trace_emit(TraceTopic::Engine, std::string("conversation lost (") +
                                       std::string(query_failure_name(ex.kind())) + "): " +
                                       ex.what());
    child_.terminate();
    throw;
  }
}

}  // namespace perftree
