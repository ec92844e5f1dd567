#include "repl.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "debug.h"
#include "error.h"
#include "render.h"
#include "script_engine.h"
#include "uci_engine.h"

namespace perftree {
namespace {

constexpr std::string_view kPrompt = "> ";

std::atomic<bool>& interrupt_flag() {
  static std::atomic<bool> flag{false};
  return flag;
}

std::atomic<bool>* g_interrupt_target = nullptr;

void on_interrupt(int /*sig*/) {
  if (g_interrupt_target) {
    g_interrupt_target->store(true, std::memory_order_release);
  }
}

// SIGINT cancels the running query instead of the whole session.
class InterruptScope {
 public:
  explicit InterruptScope(std::atomic<bool>* flag) : flag_(flag) {
    if (!flag_) {
      return;
    }
    flag_->store(false, std::memory_order_release);
    g_interrupt_target = flag_;
    struct sigaction action {};
    action.sa_handler = &on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    installed_ = ::sigaction(SIGINT, &action, &previous_) == 0;
  }

  ~InterruptScope() {
    if (installed_) {
      ::sigaction(SIGINT, &previous_, nullptr);
    }
    if (flag_) {
      g_interrupt_target = nullptr;
      flag_->store(false, std::memory_order_release);
    }
  }

  InterruptScope(const InterruptScope&) = delete;
  InterruptScope& operator=(const InterruptScope&) = delete;

 private:
  std::atomic<bool>* flag_;
  struct sigaction previous_ {};
  bool installed_{false};
};

void handle_fen(ReplContext& ctx, std::string_view args) {
  const std::vector<std::string> words = split_whitespace(args);
  if (words.empty()) {
    ctx.out << ctx.session.fen() << '\n';
    return;
  }
  ctx.session.set_fen(join_moves(words));
}

void handle_moves(ReplContext& ctx, std::string_view args) {
  MovePath moves = split_whitespace(args);
  if (moves.empty()) {
    ctx.out << join_moves(ctx.session.moves()) << '\n';
    return;
  }
  ctx.session.set_moves(std::move(moves));
}

void handle_depth(ReplContext& ctx, std::string_view args) {
  const std::string token = consume_token(args);
  if (token.empty()) {
    ctx.out << ctx.session.depth() << '\n';
    return;
  }
  const auto depth = parse_depth(token);
  if (!depth) {
    ctx.err << depth_error(token) << '\n';
    return;
  }
  ctx.session.set_depth(*depth);
}

void handle_child(ReplContext& ctx, std::string_view args) {
  std::string move = consume_token(args);
  if (move.empty()) {
    ctx.err << "missing argument, expected a child move\n";
    return;
  }
  ctx.session.goto_child(std::move(move));
}

void handle_diff(ReplContext& ctx) {
  InterruptScope scope(ctx.interrupt);
  try {
    const Diff diff = ctx.session.compare();
    write_diff(ctx.out, diff, ctx.color);
  } catch (const UsageError& ex) {
    ctx.err << "cannot compute diff: " << ex.what() << '\n';
  } catch (const QueryError& ex) {
    ctx.err << "cannot compute diff: " << ex.what() << '\n';
  }
}

void handle_trace(ReplContext& ctx, std::string_view args) {
  const std::string command = consume_token(args);
  if (command.empty() || command == "status") {
    std::string message = "trace:";
    for (int idx = 0; idx < static_cast<int>(TraceTopic::Count); ++idx) {
      const auto topic = static_cast<TraceTopic>(idx);
      message.push_back(' ');
      message.append(trace_topic_name(topic));
      message.push_back('=');
      message.append(trace_enabled(topic) ? "on" : "off");
    }
    ctx.out << message << '\n';
    return;
  }

  bool enable = false;
  if (command == "on") {
    enable = true;
  } else if (command == "off") {
    enable = false;
  } else {
    ctx.err << "trace usage: trace [status|on|off] <topic>\n";
    return;
  }

  const std::string topic_token = consume_token(args);
  if (topic_token.empty()) {
    ctx.err << "trace requires a topic (process|engine|script|session|all)\n";
    return;
  }
  if (topic_token == "all") {
    set_all_trace_topics(enable);
    return;
  }
  const auto topic = trace_topic_from_string(topic_token);
  if (!topic) {
    ctx.err << "unknown trace topic '" << topic_token << "'\n";
    return;
  }
  set_trace_topic(*topic, enable);
}

bool is_terminal(int fd) {
  return ::isatty(fd) == 1;
}

bool read_command(std::string& line) {
  if (is_terminal(STDIN_FILENO)) {
    if (is_terminal(STDOUT_FILENO)) {
      std::cout << kPrompt << std::flush;
    } else if (is_terminal(STDERR_FILENO)) {
      std::cerr << kPrompt << std::flush;
    }
  }
  return static_cast<bool>(std::getline(std::cin, line));
}

bool use_color(ColorMode mode) {
  return resolve_color(mode, is_terminal(STDOUT_FILENO), std::getenv("TERM"),
                       std::getenv("NO_COLOR"));
}

}  // namespace

bool dispatch_command(ReplContext& ctx, std::string_view line) {
  std::string_view view = line;
  const std::string command = consume_token(view);

  if (command.empty()) {
    return true;
  }

  if (command == "fen") {
    handle_fen(ctx, view);
  } else if (command == "moves") {
    handle_moves(ctx, view);
  } else if (command == "depth") {
    handle_depth(ctx, view);
  } else if (command == "root") {
    ctx.session.goto_root();
  } else if (command == "parent" || command == "unmove") {
    ctx.session.goto_parent();
  } else if (command == "child" || command == "move") {
    handle_child(ctx, view);
  } else if (command == "diff") {
    handle_diff(ctx);
  } else if (command == "chess960") {
    ctx.session.set_chess960(true);
  } else if (command == "nochess960") {
    ctx.session.set_chess960(false);
  } else if (command == "trace") {
    handle_trace(ctx, view);
  } else if (command == "exit" || command == "quit") {
    return false;
  } else {
    ctx.err << "unknown command '" << command << "'\n";
  }

  return true;
}

void repl_feed(ReplContext& ctx, std::string_view payload) {
  std::string_view remaining = payload;
  while (!remaining.empty()) {
    const auto newline = remaining.find('\n');
    const std::string_view line =
        (newline == std::string_view::npos) ? remaining : remaining.substr(0, newline);
    if (!dispatch_command(ctx, line)) {
      break;
    }
    if (newline == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(newline + 1);
  }
}

int repl_main(const Options& options) {
  for (const TraceTopic topic : options.trace) {
    set_trace_topic(topic, true);
  }

  std::atomic<bool>& interrupted = interrupt_flag();
  QueryLimits limits;
  limits.timeout = options.timeout;
  limits.cancel = &interrupted;

  std::unique_ptr<UciEngine> engine;
  try {
    engine = std::make_unique<UciEngine>(options.engine, limits);
  } catch (const QueryError& ex) {
    std::cerr << "cannot start reference engine: " << ex.what() << '\n';
    return 1;
  }
  ScriptEngine script(options.script, limits);

  Session session(script, *engine);
  if (!options.fen.empty()) {
    session.set_fen(options.fen);
  }
  if (options.depth) {
    session.set_depth(*options.depth);
  }

  ReplContext ctx{session, std::cout, std::cerr, use_color(options.color), &interrupted};
  std::string line;
  while (read_command(line)) {
    if (!dispatch_command(ctx, line)) {
      break;
    }
  }
  return 0;
}

}  // namespace perftree
