#include "subprocess.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <cerrno>
#include <csignal>
#include <string>
#include <thread>
#include <utility>

#include <sys/types.h>

#include "error.h"

namespace perftree::test {

namespace {

bool process_alive(pid_t pid) {
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

Stdio piped_all() {
  Stdio stdio;
  stdio.in = StreamMode::Pipe;
  stdio.out = StreamMode::Pipe;
  stdio.err = StreamMode::Pipe;
  return stdio;
}

}  // namespace

TEST_CASE("communicate collects stdout, stderr and exit status", "[process]") {
  Subprocess child = Subprocess::spawn(
      {"sh", "-c", "printf 'one\\ntwo\\n'; printf 'oops' >&2; exit 4"}, piped_all());
  const CapturedOutput out = child.communicate(Deadline::never(), nullptr);
  CHECK(out.out == "one\ntwo\n");
  CHECK(out.err == "oops");
  CHECK(out.exit_status == 4);
  CHECK_FALSE(child.running());
}

TEST_CASE("read_line splits a conversation into lines", "[process]") {
  Subprocess child = Subprocess::spawn({"sh", "-c", "read a; echo \"got $a\"; printf 'tail'"},
                                       piped_all());
  child.write("hello\n");
  CHECK(child.read_line(Deadline::never(), nullptr) == "got hello");
  CHECK(child.read_line(Deadline::never(), nullptr) == "tail");
  REQUIRE_THROWS_AS(child.read_line(Deadline::never(), nullptr), QueryError);
}

TEST_CASE("read_line times out on a silent child", "[process]") {
  Subprocess child = Subprocess::spawn({"sh", "-c", "sleep 30"}, piped_all());
  try {
    (void)child.read_line(Deadline::after(std::chrono::milliseconds(100)), nullptr);
    FAIL("silent child produced a line");
  } catch (const QueryError& ex) {
    CHECK(ex.kind() == QueryFailure::Timeout);
  }
}

TEST_CASE("Children ignore the terminal interrupt", "[process]") {
  Subprocess child =
      Subprocess::spawn({"sh", "-c", "kill -INT $$; echo still here"}, piped_all());
  const CapturedOutput out = child.communicate(Deadline::never(), nullptr);
  CHECK(out.out == "still here\n");
  CHECK(out.exit_status == 0);
}

TEST_CASE("alive reaps a child that exited on its own", "[process]") {
  Subprocess sleeper = Subprocess::spawn({"sh", "-c", "sleep 30"}, piped_all());
  CHECK(sleeper.alive());
  CHECK(sleeper.running());

  Subprocess quitter = Subprocess::spawn({"sh", "-c", "exit 0"}, piped_all());
  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (quitter.alive() && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  CHECK_FALSE(quitter.alive());
  CHECK_FALSE(quitter.running());
}

TEST_CASE("Destroying a Subprocess kills the child", "[process]") {
  pid_t pid = -1;
  {
    Subprocess child = Subprocess::spawn({"sh", "-c", "sleep 30"}, piped_all());
    pid = child.pid();
    REQUIRE(process_alive(pid));
  }
  REQUIRE_FALSE(process_alive(pid));
}

TEST_CASE("Moving a Subprocess transfers ownership", "[process]") {
  Subprocess first = Subprocess::spawn({"sh", "-c", "sleep 30"}, piped_all());
  const pid_t pid = first.pid();
  Subprocess second = std::move(first);
  CHECK_FALSE(first.running());
  CHECK(second.pid() == pid);
  second.terminate();
  CHECK_FALSE(second.running());
  second.terminate();
}

TEST_CASE("Writing to an exited child is a transport failure", "[process]") {
  Subprocess child = Subprocess::spawn({"sh", "-c", "exit 0"}, piped_all());
  REQUIRE_THROWS_AS(child.read_line(Deadline::never(), nullptr), QueryError);
  try {
    child.write("anyone there?\n");
    FAIL("write to exited child succeeded");
  } catch (const QueryError& ex) {
    CHECK(ex.kind() == QueryFailure::Transport);
  }
}

TEST_CASE("Spawning an unknown program reports the program name", "[process]") {
  try {
    (void)Subprocess::spawn({"perftree-test-no-such-program"}, Stdio{});
    FAIL("unknown program started");
  } catch (const QueryError& ex) {
    CHECK(ex.kind() == QueryFailure::Transport);
    CHECK(std::string(ex.what()).find("perftree-test-no-such-program") != std::string::npos);
  }
}

}  // namespace perftree::test
