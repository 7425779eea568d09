/**
 * @file process_runner.cpp
 * @brief Bounded-time process execution implementation
 *
 * @details Provides implementations for:
 *
 *          - UniqueFd / ChildProcess: RAII owners for pipe ends and the child
 *
 *          - ProcessRunner::run - spawn, capture, deadline, kill, reap
 */

#include "vidpress/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vidpress/logging.hpp"

extern char **environ;

namespace vidpress {

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

/// Upper bound on one poll() so child exit is noticed promptly
constexpr int POLL_SLICE_MS = 50;

/**
 * @class UniqueFd
 * @brief RAII owner of a file descriptor. Move-only.
 */
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  int get() const { return fd_; }
  bool is_open() const { return fd_ != -1; }

  void reset(int fd = -1) {
    if (fd_ != -1) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

bool make_pipe(Pipe &p) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1)
    return false;
  p.read_end.reset(fds[0]);
  p.write_end.reset(fds[1]);
  return true;
}

/**
 * @class ChildProcess
 * @brief Owns a spawned child that leads its own process group.
 * @note The destructor kills the group and reaps the child if nobody did.
 */
class ChildProcess {
public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}

  ~ChildProcess() {
    if (!reaped_) {
      kill_group();
      reap();
    }
  }

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  pid_t pid() const { return pid_; }

  /**
   * @brief Check for exit without reaping, so the group id stays reserved.
   */
  bool has_exited() const {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info,
               WEXITED | WNOHANG | WNOWAIT) == -1) {
      return errno != EINTR;
    }
    return info.si_pid == pid_;
  }

  void kill_group() const {
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
  }

  /**
   * @brief Blocking reap.
   * @return Exit code, 128 + signal number, or -1 if the status was lost
   */
  int reap() {
    int status = 0;
    pid_t r;
    do {
      r = waitpid(pid_, &status, 0);
    } while (r == -1 && errno == EINTR);
    reaped_ = true;

    if (r != pid_)
      return -1;
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

private:
  pid_t pid_;
  bool reaped_ = false;
};

/// Append and keep only the last `cap` bytes
void append_capped(std::string &buf, const char *data, std::size_t n,
                   std::size_t cap) {
  buf.append(data, n);
  if (buf.size() > cap) {
    buf = utf8_tail(buf, cap);
  }
}

/**
 * @brief Read whatever is ready on one pipe.
 * @return false once the pipe reached EOF or failed
 */
bool read_ready(int fd, std::string &buf, std::size_t cap) {
  char chunk[READ_CHUNK];
  ssize_t n;
  do {
    n = ::read(fd, chunk, sizeof(chunk));
  } while (n == -1 && errno == EINTR);

  if (n > 0) {
    append_capped(buf, chunk, static_cast<std::size_t>(n), cap);
    return true;
  }
  return false;
}

/**
 * @brief Poll both capture pipes once and consume ready data.
 * @return Number of ready descriptors, 0 on timeout, -1 on poll failure
 */
int pump_pipes(UniqueFd &out, UniqueFd &err, std::string &out_buf,
               std::string &err_buf, std::size_t cap, int wait_ms) {
  pollfd fds[2];
  fds[0] = {out.is_open() ? out.get() : -1, POLLIN, 0};
  fds[1] = {err.is_open() ? err.get() : -1, POLLIN, 0};

  int ready = ::poll(fds, 2, wait_ms);
  if (ready <= 0) {
    return (ready == -1 && errno != EINTR) ? -1 : 0;
  }

  if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
    if (!read_ready(out.get(), out_buf, cap))
      out.reset();
  }
  if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
    if (!read_ready(err.get(), err_buf, cap))
      err.reset();
  }
  return ready;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  return static_cast<int>(std::max<long long>(0, left));
}

} // anonymous namespace

std::string utf8_tail(const std::string &text, std::size_t max_bytes) {
  std::size_t start = text.size() > max_bytes ? text.size() - max_bytes : 0;
  if (start == 0)
    return text;

  /// 10xxxxxx continues a sequence; a lead byte is at most 3 bytes back
  auto is_continuation = [&text](std::size_t i) {
    return (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80;
  };
  for (int skipped = 0;
       skipped < 3 && start < text.size() && is_continuation(start);
       ++skipped) {
    ++start;
  }
  return text.substr(start);
}

ProcessRunner::ProcessRunner(std::size_t max_capture_bytes)
    : max_capture_bytes_(max_capture_bytes) {}

Result<ExecutionResult>
ProcessRunner::run(const std::vector<std::string> &argv,
                   std::chrono::milliseconds timeout) const {
  if (argv.empty() || argv[0].empty()) {
    return Error::system("Empty command");
  }

  // **---- Capture pipes ----**

  Pipe out_pipe;
  Pipe err_pipe;
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe)) {
    return Error::system(
        fmt::format("Failed to create pipes: {}", std::strerror(errno)));
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    c_argv.push_back(const_cast<char *>(a.c_str()));
  }
  c_argv.push_back(nullptr);

  // **---- Spawn ----**

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null",
                                   O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe.write_end.get(),
                                   STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe.write_end.get(),
                                   STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t no_signals;
  sigemptyset(&no_signals);
  posix_spawnattr_setsigmask(&attr, &no_signals);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP |
                                      POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF);

  auto start = std::chrono::steady_clock::now();
  auto deadline = start + timeout;

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(),
                        environ);

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  if (rc != 0) {
    if (rc == ENOENT || rc == EACCES || rc == ENOTDIR) {
      return Error::tool_not_found(argv[0]);
    }
    return Error::system(
        fmt::format("Failed to spawn {}: {}", argv[0], std::strerror(rc)));
  }

  ChildProcess child(pid);

  /// Parent keeps only the read ends
  out_pipe.write_end.reset();
  err_pipe.write_end.reset();

  ExecutionResult result;

  // **---- Wait with deadline ----**

  for (;;) {
    if (child.has_exited()) {
      /// Drain what the child left behind, still bounded by the deadline
      while ((out_pipe.read_end.is_open() || err_pipe.read_end.is_open()) &&
             remaining_ms(deadline) > 0) {
        if (pump_pipes(out_pipe.read_end, err_pipe.read_end,
                       result.stdout_text, result.stderr_text,
                       max_capture_bytes_, 0) <= 0)
          break;
      }
      break;
    }

    int left = remaining_ms(deadline);
    if (left <= 0) {
      LOG_WARN("Process {} ({}) exceeded {} ms; killing process group", pid,
               argv[0], timeout.count());
      child.kill_group();
      child.reap();
      return Error::timeout(static_cast<double>(timeout.count()) / 1000.0);
    }

    int slice = std::min(left, POLL_SLICE_MS);
    if (out_pipe.read_end.is_open() || err_pipe.read_end.is_open()) {
      if (pump_pipes(out_pipe.read_end, err_pipe.read_end, result.stdout_text,
                     result.stderr_text, max_capture_bytes_, slice) == -1) {
        int poll_errno = errno;
        child.kill_group();
        child.reap();
        return Error::system(
            fmt::format("poll() failed: {}", std::strerror(poll_errno)));
      }
    } else {
      ::poll(nullptr, 0, slice);
    }
  }

  /// Leader has exited; take down anything it left running, then reap
  child.kill_group();
  result.exit_code = child.reap();
  result.elapsed_sec =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
          .count();

  return result;
}

} // namespace vidpress
