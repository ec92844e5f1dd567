#pragma once
// repl.h -- Line-oriented command loop driving a Session.
// Exposes the dispatcher separately from the terminal loop so that scripted
// input can be fed through the same code path.

#include <atomic>
#include <iosfwd>
#include <string_view>

#include "options.h"
#include "session.h"

namespace perftree {

struct ReplContext {
  Session& session;
  std::ostream& out;
  std::ostream& err;
  bool color{false};
  // Raised by SIGINT while a diff runs; nullptr leaves SIGINT alone.
  std::atomic<bool>* interrupt{nullptr};
};

/** Runs one command line. Returns false when the session should end. */
bool dispatch_command(ReplContext& ctx, std::string_view line);

/** Dispatches every line of `payload` until exhausted or `exit`/`quit`. */
void repl_feed(ReplContext& ctx, std::string_view payload);

int repl_main(const Options& options);

}  // namespace perftree
