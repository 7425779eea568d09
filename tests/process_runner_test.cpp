#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vidpress/process_runner.hpp"

using namespace vidpress;
using namespace vidpress::testing_support;
using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
  ProcessRunner runner;

  Result<ExecutionResult> sh(const std::string &script,
                             std::chrono::milliseconds timeout = 5s) {
    return runner.run({"/bin/sh", "-c", script}, timeout);
  }
};

TEST_F(ProcessRunnerTest, CapturesOutputAndExitCode) {
  auto r = sh("echo out; echo err >&2; exit 3");
  ASSERT_FALSE(is_error(r));
  const auto &res = std::get<ExecutionResult>(r);
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.stdout_text, "out\n");
  EXPECT_EQ(res.stderr_text, "err\n");
  EXPECT_GE(res.elapsed_sec, 0.0);
}

TEST_F(ProcessRunnerTest, SuccessfulRun) {
  auto r = runner.run({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "a b"},
                      5s);
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(std::get<ExecutionResult>(r).exit_code, 0);
  /// Arguments travel as discrete tokens; no shell re-splitting
  EXPECT_EQ(std::get<ExecutionResult>(r).stdout_text, "a b");
}

TEST_F(ProcessRunnerTest, SignalDeathMapsTo128PlusSignal) {
  auto r = sh("kill -TERM $$");
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(std::get<ExecutionResult>(r).exit_code, 128 + 15);
}

TEST_F(ProcessRunnerTest, StdinIsEmpty) {
  auto r = sh("cat; echo done");
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(std::get<ExecutionResult>(r).stdout_text, "done\n");
}

TEST_F(ProcessRunnerTest, MissingExecutableIsToolNotFound) {
  auto r = runner.run({"/nonexistent/vidpress-no-such-tool"}, 5s);
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::ToolNotFound);

  auto by_name = runner.run({"vidpress-no-such-tool-on-path"}, 5s);
  ASSERT_TRUE(is_error(by_name));
  EXPECT_EQ(error_of(by_name).kind, ErrorKind::ToolNotFound);
}

TEST_F(ProcessRunnerTest, TimeoutKillsProcess) {
  auto start = std::chrono::steady_clock::now();
  auto r = sh("sleep 30", 300ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::Timeout);
  EXPECT_EQ(error_of(r).message, "Processing timeout after 0.3 seconds");
  EXPECT_LT(elapsed, 5s);
}

TEST_F(ProcessRunnerTest, TimeoutKillsWholeProcessTree) {
  ScratchDir dir;
  const std::string pidfile = dir.file("pids");

  auto r = sh("sleep 30 & echo $! > " + pidfile + "; echo $$ >> " + pidfile +
                  "; wait",
              500ms);
  ASSERT_TRUE(is_error(r));
  EXPECT_EQ(error_of(r).kind, ErrorKind::Timeout);

  std::istringstream pids(read_file(pidfile));
  long pid = 0;
  int checked = 0;
  while (pids >> pid) {
    ++checked;
    bool alive = true;
    for (int i = 0; i < 40 && alive; ++i) {
      alive = process_alive(pid);
      if (alive)
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_FALSE(alive) << "pid " << pid << " outlived the timeout";
  }
  EXPECT_EQ(checked, 2);
}

TEST_F(ProcessRunnerTest, StrayBackgroundChildIsKilledAfterNormalExit) {
  ScratchDir dir;
  const std::string pidfile = dir.file("pid");

  auto r = sh("sleep 30 >/dev/null 2>&1 & echo $! > " + pidfile + "; exit 0");
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(std::get<ExecutionResult>(r).exit_code, 0);

  long pid = std::stol(read_file(pidfile));
  bool alive = true;
  for (int i = 0; i < 40 && alive; ++i) {
    alive = process_alive(pid);
    if (alive)
      std::this_thread::sleep_for(50ms);
  }
  EXPECT_FALSE(alive);
}

TEST_F(ProcessRunnerTest, CaptureKeepsTail) {
  ProcessRunner small(16);
  auto r = small.run(
      {"/bin/sh", "-c", "i=0; while [ $i -lt 100 ]; do printf x; "
                        "i=$((i+1)); done; printf END"},
      5s);
  ASSERT_FALSE(is_error(r));
  const auto &out = std::get<ExecutionResult>(r).stdout_text;
  EXPECT_EQ(out.size(), 16u);
  EXPECT_EQ(out.substr(out.size() - 3), "END");
}

TEST_F(ProcessRunnerTest, LargeOutputDoesNotDeadlock) {
  auto r = sh("head -c 2000000 /dev/zero; head -c 2000000 /dev/zero >&2");
  ASSERT_FALSE(is_error(r));
  const auto &res = std::get<ExecutionResult>(r);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_text.size(), 1024u * 1024u);
  EXPECT_EQ(res.stderr_text.size(), 1024u * 1024u);
}

TEST_F(ProcessRunnerTest, CaptureTailStartsOnCharacterBoundary) {
  ProcessRunner small(5);
  auto r = small.run({"/bin/sh", "-c", R"(printf '\303\251\303\251\303\251')"},
                     5s);
  ASSERT_FALSE(is_error(r));
  EXPECT_EQ(std::get<ExecutionResult>(r).stdout_text, "\xc3\xa9\xc3\xa9");
}

// **---- utf8_tail ----**

TEST(Utf8TailTest, ShortTextIsUnchanged) {
  EXPECT_EQ(utf8_tail("abc", 10), "abc");
  EXPECT_EQ(utf8_tail("\xc3\xa9", 2), "\xc3\xa9");
  EXPECT_EQ(utf8_tail("", 4), "");
}

TEST(Utf8TailTest, AsciiIsCutExactly) {
  EXPECT_EQ(utf8_tail("0123456789", 4), "6789");
}

TEST(Utf8TailTest, SplitSequenceIsDropped) {
  /// "é" then "x": a 2-byte cut lands on the continuation byte
  EXPECT_EQ(utf8_tail("\xc3\xa9x", 2), "x");
  /// 4-byte emoji: cutting after its lead byte leaves three continuations
  EXPECT_EQ(utf8_tail("\xf0\x9f\x8e\xac!", 4), "!");
  EXPECT_EQ(utf8_tail("a\xf0\x9f\x8e\xac", 3), "");
  EXPECT_EQ(utf8_tail("a\xf0\x9f\x8e\xac", 4), "\xf0\x9f\x8e\xac");
}
