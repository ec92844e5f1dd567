#include "subprocess.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "debug.h"
#include "error.h"

namespace perftree {
namespace {

constexpr int kPollSliceMs = 100;
constexpr int kExecFailedStatus = 127;

void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Both ends of one pipe, closed on scope exit unless released.
struct Pipe {
  std::array<int, 2> fds{-1, -1};

  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    close_fd(fds[0]);
    close_fd(fds[1]);
  }

  bool open() { return ::pipe2(fds.data(), O_CLOEXEC) == 0; }

  int release(int idx) {
    return std::exchange(fds[static_cast<std::size_t>(idx)], -1);
  }
};

std::string errno_text(int err) {
  return std::strerror(err);
}

[[noreturn]] void transport_failure(const std::string& message) {
  throw QueryError(QueryFailure::Transport, message);
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Runs in the forked child: only async-signal-safe calls from here on.
void redirect_child_stream(StreamMode mode, int pipe_end, int target, int null_fd) {
  if (mode == StreamMode::Pipe) {
    ::dup2(pipe_end, target);
  } else if (mode == StreamMode::Null) {
    ::dup2(null_fd, target);
  }
}

}  // namespace

Deadline Deadline::after(std::chrono::milliseconds timeout) {
  Deadline deadline;
  if (timeout.count() > 0) {
    deadline.at_ = std::chrono::steady_clock::now() + timeout;
    deadline.timeout_ = timeout;
  }
  return deadline;
}

bool Deadline::expired() const {
  return at_ && std::chrono::steady_clock::now() >= *at_;
}

int Deadline::poll_slice_ms() const {
  if (!at_) {
    return kPollSliceMs;
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      *at_ - std::chrono::steady_clock::now());
  return static_cast<int>(std::clamp<std::int64_t>(remaining.count(), 1, kPollSliceMs));
}

Subprocess Subprocess::spawn(const std::vector<std::string>& argv, Stdio stdio) {
  if (argv.empty() || argv.front().empty()) {
    transport_failure("no program to run");
  }
  ignore_sigpipe();

  Pipe in_pipe;
  Pipe out_pipe;
  Pipe err_pipe;
  Pipe status_pipe;
  if ((stdio.in == StreamMode::Pipe && !in_pipe.open()) ||
      (stdio.out == StreamMode::Pipe && !out_pipe.open()) ||
      (stdio.err == StreamMode::Pipe && !err_pipe.open()) || !status_pipe.open()) {
    transport_failure("cannot create pipes for '" + argv.front() + "': " + errno_text(errno));
  }

  int null_fd = -1;
  if (stdio.in == StreamMode::Null || stdio.out == StreamMode::Null ||
      stdio.err == StreamMode::Null) {
    null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
      transport_failure("cannot open /dev/null: " + errno_text(errno));
    }
  }

  std::vector<char*> raw_argv;
  raw_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  raw_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    close_fd(null_fd);
    transport_failure("cannot fork for '" + argv.front() + "': " + errno_text(err));
  }

  if (pid == 0) {
    // Ctrl-C belongs to perftree, which cancels the query and kills children itself.
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGINT, &ignore, nullptr);
    redirect_child_stream(stdio.in, in_pipe.fds[0], STDIN_FILENO, null_fd);
    redirect_child_stream(stdio.out, out_pipe.fds[1], STDOUT_FILENO, null_fd);
    redirect_child_stream(stdio.err, err_pipe.fds[1], STDERR_FILENO, null_fd);
    ::execvp(raw_argv[0], raw_argv.data());
    const int err = errno;
    (void)!::write(status_pipe.fds[1], &err, sizeof(err));
    ::_exit(kExecFailedStatus);
  }

  close_fd(null_fd);
  close_fd(status_pipe.fds[1]);

  Subprocess child;
  child.pid_ = pid;
  child.program_ = argv.front();
  child.stdin_fd_ = in_pipe.release(1);
  child.stdout_fd_ = out_pipe.release(0);
  child.stderr_fd_ = err_pipe.release(0);

  // The status pipe closes on a successful exec; an errno arrives otherwise.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(status_pipe.fds[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    child.terminate();
    transport_failure("cannot start '" + argv.front() + "': " + errno_text(exec_errno));
  }

  if (trace_enabled(TraceTopic::Process)) {
    std::ostringstream oss;
    oss << "spawn pid=" << pid << " argv=";
    for (std::size_t idx = 0; idx < argv.size(); ++idx) {
      oss << (idx > 0 ? " " : "") << '\'' << argv[idx] << '\'';
    }
    trace_emit(TraceTopic::Process, oss.str());
  }
  return child;
}

Subprocess::~Subprocess() {
  terminate();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdin_fd_(std::exchange(other.stdin_fd_, -1)),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      read_buffer_(std::move(other.read_buffer_)),
      program_(std::move(other.program_)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
  if (this != &other) {
    terminate();
    pid_ = std::exchange(other.pid_, -1);
    stdin_fd_ = std::exchange(other.stdin_fd_, -1);
    stdout_fd_ = std::exchange(other.stdout_fd_, -1);
    stderr_fd_ = std::exchange(other.stderr_fd_, -1);
    read_buffer_ = std::move(other.read_buffer_);
    program_ = std::move(other.program_);
  }
  return *this;
}

void Subprocess::write(std::string_view data) {
  if (stdin_fd_ < 0) {
    transport_failure("cannot write to '" + program_ + "': input is closed");
  }
  while (!data.empty()) {
    const ssize_t n = ::write(stdin_fd_, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      transport_failure("write to '" + program_ + "' failed: " + errno_text(errno));
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
}

void Subprocess::close_stdin() noexcept {
  close_fd(stdin_fd_);
}

void Subprocess::wait_readable(int fd, const Deadline& deadline,
                               const std::atomic<bool>* cancel) const {
  while (true) {
    if (cancel && cancel->load(std::memory_order_acquire)) {
      throw QueryError(QueryFailure::Cancelled, "query to '" + program_ + "' interrupted");
    }
    if (deadline.expired()) {
      throw QueryError(QueryFailure::Timeout,
                       "'" + program_ + "' unresponsive: no reply within " +
                           std::to_string(deadline.timeout().count()) + " ms");
    }
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ret = ::poll(&pfd, 1, deadline.poll_slice_ms());
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      transport_failure("poll on '" + program_ + "' failed: " + errno_text(errno));
    }
    if (ret == 0) {
      continue;
    }
    // POLLHUP without POLLIN still means read() reports EOF; let it.
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0 && (pfd.revents & POLLIN) == 0) {
      transport_failure("pipe error while reading from '" + program_ + "'");
    }
    return;
  }
}

std::string Subprocess::read_line(const Deadline& deadline, const std::atomic<bool>* cancel) {
  if (stdout_fd_ < 0) {
    transport_failure("cannot read from '" + program_ + "': output is closed");
  }
  while (true) {
    const auto newline = read_buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = read_buffer_.substr(0, newline);
      read_buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }

    wait_readable(stdout_fd_, deadline, cancel);
    std::array<char, 4096> buf{};
    const ssize_t n = ::read(stdout_fd_, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      transport_failure("read from '" + program_ + "' failed: " + errno_text(errno));
    }
    if (n == 0) {
      if (!read_buffer_.empty()) {
        return std::exchange(read_buffer_, std::string{});
      }
      transport_failure("'" + program_ + "' closed its output (exited?)");
    }
    read_buffer_.append(buf.data(), static_cast<std::size_t>(n));
  }
}

CapturedOutput Subprocess::communicate(const Deadline& deadline,
                                       const std::atomic<bool>* cancel) {
  close_stdin();
  CapturedOutput captured;
  captured.out = std::exchange(read_buffer_, std::string{});

  std::array<char, 4096> buf{};
  while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
    if (cancel && cancel->load(std::memory_order_acquire)) {
      throw QueryError(QueryFailure::Cancelled, "query to '" + program_ + "' interrupted");
    }
    if (deadline.expired()) {
      throw QueryError(QueryFailure::Timeout,
                       "'" + program_ + "' unresponsive: no output within " +
                           std::to_string(deadline.timeout().count()) + " ms");
    }

    std::array<pollfd, 2> pfds{};
    std::array<int*, 2> owners{};
    std::array<std::string*, 2> sinks{};
    nfds_t count = 0;
    if (stdout_fd_ >= 0) {
      pfds[count] = pollfd{stdout_fd_, POLLIN, 0};
      owners[count] = &stdout_fd_;
      sinks[count] = &captured.out;
      ++count;
    }
    if (stderr_fd_ >= 0) {
      pfds[count] = pollfd{stderr_fd_, POLLIN, 0};
      owners[count] = &stderr_fd_;
      sinks[count] = &captured.err;
      ++count;
    }

    const int ret = ::poll(pfds.data(), count, deadline.poll_slice_ms());
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      transport_failure("poll on '" + program_ + "' failed: " + errno_text(errno));
    }
    for (nfds_t idx = 0; idx < count; ++idx) {
      if (pfds[idx].revents == 0) {
        continue;
      }
      const ssize_t n = ::read(*owners[idx], buf.data(), buf.size());
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        transport_failure("read from '" + program_ + "' failed: " + errno_text(errno));
      }
      if (n == 0) {
        close_fd(*owners[idx]);
        continue;
      }
      sinks[idx]->append(buf.data(), static_cast<std::size_t>(n));
    }
  }

  captured.exit_status = reap(deadline, cancel);
  return captured;
}

int Subprocess::reap(const Deadline& deadline, const std::atomic<bool>* cancel) {
  while (pid_ > 0) {
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
      const int code = decode_status(status);
      trace_emit(TraceTopic::Process,
                 "exit pid=" + std::to_string(pid_) + " status=" + std::to_string(code));
      pid_ = -1;
      return code;
    }
    if (result < 0 && errno != EINTR) {
      const int err = errno;
      pid_ = -1;
      transport_failure("waitpid on '" + program_ + "' failed: " + errno_text(err));
    }
    if (cancel && cancel->load(std::memory_order_acquire)) {
      throw QueryError(QueryFailure::Cancelled, "query to '" + program_ + "' interrupted");
    }
    if (deadline.expired()) {
      throw QueryError(QueryFailure::Timeout,
                       "'" + program_ + "' did not exit within " +
                           std::to_string(deadline.timeout().count()) + " ms");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return -1;
}

bool Subprocess::alive() {
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == 0 || (result < 0 && errno == EINTR)) {
    return true;
  }
  if (result == pid_) {
    trace_emit(TraceTopic::Process, "exited pid=" + std::to_string(pid_) +
                                        " status=" + std::to_string(decode_status(status)));
  }
  close_pipes();
  pid_ = -1;
  return false;
}

void Subprocess::close_pipes() noexcept {
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  read_buffer_.clear();
}

void Subprocess::terminate() noexcept {
  close_pipes();
  if (pid_ <= 0) {
    return;
  }
  ::kill(pid_, SIGKILL);
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  if (trace_enabled(TraceTopic::Process)) {
    trace_emit(TraceTopic::Process, "killed pid=" + std::to_string(pid_));
  }
  pid_ = -1;
}

}  // namespace perftree
