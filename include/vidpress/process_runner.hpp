/**
 * @file process_runner.hpp
 * @brief Bounded-time execution of an external process
 *
 * @details The runner spawns the argument vector directly (no shell), in a
 *          process group of its own, with stdin bound to /dev/null and
 *          stdout/stderr captured through pipes.
 *
 * @attention LIFECYCLE:
 *
 *   1. Spawn (posix_spawnp, new process group)
 *
 *   2. Read output until the child exits or the deadline passes
 *
 *   3. On deadline: SIGKILL the whole group, reap, report Timeout
 *
 *   4. On exit: SIGKILL any stray group members, reap, report status
 *
 * @note The child is always reaped before run() returns, on every path.
 *       No retries are attempted here.
 */

#ifndef VIDPRESS_PROCESS_RUNNER_HPP
#define VIDPRESS_PROCESS_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace vidpress {

/**
 * @brief Last max_bytes of text, never starting inside a UTF-8 sequence.
 * @note Leading continuation bytes left by the cut are dropped, so the result
 *       may be up to three bytes shorter than max_bytes.
 */
std::string utf8_tail(const std::string &text, std::size_t max_bytes);

/**
 * @class ProcessRunner
 * @brief Runs one command with a hard wall-clock timeout.
 * @note Stateless apart from its capture limit; safe to share across threads.
 */
class ProcessRunner {
public:
  /**
   * @param max_capture_bytes Per-stream capture cap; the tail is kept
   */
  explicit ProcessRunner(std::size_t max_capture_bytes = 1024 * 1024);

  /**
   * @brief Execute argv and wait up to timeout.
   * @return ExecutionResult for any process that finished in time (including
   *         non-zero exits), Timeout when the deadline passed, ToolNotFound
   *         when argv[0] cannot be executed, System for OS failures
   */
  Result<ExecutionResult> run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) const;

  Result<ExecutionResult> run(const Command &command,
                              std::chrono::milliseconds timeout) const {
    return run(command.argv, timeout);
  }

private:
  std::size_t max_capture_bytes_;
};

} // namespace vidpress

#endif // VIDPRESS_PROCESS_RUNNER_HPP
