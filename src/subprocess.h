#pragma once
/**
 * @file subprocess.h
 * @brief Child processes with piped standard streams and bounded reads.
 *
 * A `Subprocess` owns the child pid and the parent's ends of its pipes. The
 * child is killed and reaped when the owner goes away, whichever path the
 * owner leaves by, so no backend ever outlives the session that started it.
 * Blocking reads poll in short slices so that a deadline or a cancel flag
 * raised from a signal handler interrupts them promptly.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace perftree {

/** Per-query bounds shared by both backends. */
struct QueryLimits {
  std::chrono::milliseconds timeout{0};  ///< Zero waits forever.
  const std::atomic<bool>* cancel{nullptr};
};

class Deadline {
 public:
  static Deadline after(std::chrono::milliseconds timeout);
  static Deadline never() { return Deadline{}; }

  [[nodiscard]] bool expired() const;
  [[nodiscard]] int poll_slice_ms() const;
  [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

 private:
  std::optional<std::chrono::steady_clock::time_point> at_;
  std::chrono::milliseconds timeout_{0};
};

enum class StreamMode : std::uint8_t { Inherit, Pipe, Null };

struct Stdio {
  StreamMode in{StreamMode::Null};
  StreamMode out{StreamMode::Pipe};
  StreamMode err{StreamMode::Inherit};
};

struct CapturedOutput {
  std::string out;
  std::string err;
  int exit_status{0};
};

class Subprocess {
 public:
  /**
   * Start `argv[0]` (looked up on PATH) with the remaining arguments.
   * Throws `QueryError{Transport}` when pipes cannot be created or the
   * program cannot be executed.
   */
  static Subprocess spawn(const std::vector<std::string>& argv, Stdio stdio);

  Subprocess() = default;
  ~Subprocess();
  Subprocess(Subprocess&& other) noexcept;
  Subprocess& operator=(Subprocess&& other) noexcept;
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

  /** Reaps the child if it has exited since the last call; false once it is gone. */
  bool alive();
  [[nodiscard]] pid_t pid() const noexcept { return pid_; }
  [[nodiscard]] const std::string& program() const noexcept { return program_; }

  void write(std::string_view data);
  void close_stdin() noexcept;

  /** Next stdout line without its terminator; EOF with nothing buffered throws. */
  std::string read_line(const Deadline& deadline, const std::atomic<bool>* cancel);

  /** Drain stdout and stderr to EOF, then reap the child. */
  CapturedOutput communicate(const Deadline& deadline, const std::atomic<bool>* cancel);

  /** SIGKILL and reap. Safe to call repeatedly. */
  void terminate() noexcept;

 private:
  void wait_readable(int fd, const Deadline& deadline, const std::atomic<bool>* cancel) const;
  int reap(const Deadline& deadline, const std::atomic<bool>* cancel);
  void close_pipes() noexcept;

  pid_t pid_{-1};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  int stderr_fd_{-1};
  std::string read_buffer_;
  std::string program_;
};

}  // namespace perftree
