/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Run short-lived external tools with piped stdin/stdout and a deadline.
 *
 * Linux-only. Used by the clipboard backends to drive wl-paste, xclip and
 * friends. A child that outlives its deadline is killed with SIGKILL and
 * reaped before RunTool returns.
 */

#ifndef CLIPSYNC_PROCESS_HPP_
#define CLIPSYNC_PROCESS_HPP_

#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace clipsync {

// ============================================================================
// ProcessError
// ============================================================================

enum class ProcessError : uint8_t {
  kSpawnFailed = 0,  ///< pipe/fork failure
  kTimeout           ///< deadline passed; child was killed
};

inline const char* ProcessErrorToString(ProcessError e) noexcept {
  switch (e) {
    case ProcessError::kSpawnFailed: return "spawn failed";
    case ProcessError::kTimeout:     return "timeout";
    default:                         return "unknown";
  }
}

/// @brief Outcome of a tool that ran to completion.
struct ToolResult {
  int exit_code;       ///< -1 when killed by a signal
  std::string output;  ///< captured stdout (empty unless requested)

  ToolResult() : exit_code(-1) {}
};

namespace detail {

inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

  /// @brief Create a close-on-exec pipe. Returns false on failure.
  bool Create() { return ::pipe2(fd_, O_CLOEXEC) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() { CloseOne(0); }
  void CloseWrite() { CloseOne(1); }
  void CloseAll() {
    CloseOne(0);
    CloseOne(1);
  }

 private:
  void CloseOne(int idx) {
    if (fd_[idx] >= 0) {
      ::close(fd_[idx]);
      fd_[idx] = -1;
    }
  }

  int fd_[2];
};

/**
 * @brief Blocks SIGPIPE on the calling thread while feeding a child's stdin.
 *
 * A child that exits without reading turns our write into EPIPE instead of a
 * process-wide SIGPIPE. Any SIGPIPE raised meanwhile is consumed before the
 * old mask is restored.
 */
class SigpipeBlock {
 public:
  SigpipeBlock() : was_pending_(false) {
    sigset_t pipe_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    if (sigpending(&pending) == 0) {
      was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_mask_);
  }

  ~SigpipeBlock() {
    if (!was_pending_) {
      sigset_t pending;
      sigemptyset(&pending);
      if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
        sigset_t pipe_set;
        sigemptyset(&pipe_set);
        sigaddset(&pipe_set, SIGPIPE);
        struct timespec zero = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {
        }
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  }

  SigpipeBlock(const SigpipeBlock&) = delete;
  SigpipeBlock& operator=(const SigpipeBlock&) = delete;

 private:
  sigset_t old_mask_;
  bool was_pending_;
};

inline bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

inline void KillAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace detail

// ============================================================================
// FindInPath
// ============================================================================

/**
 * @brief Resolve @p name to an executable path, the way `which` does.
 *
 * Names containing '/' are checked as given. Empty PATH entries mean the
 * current directory.
 */
inline optional<std::string> FindInPath(const std::string& name) {
  auto is_exec = [](const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
  };
  if (name.empty()) {
    return optional<std::string>();
  }
  if (name.find('/') != std::string::npos) {
    return is_exec(name) ? optional<std::string>(name) : optional<std::string>();
  }
  const char* env = std::getenv("PATH");
  std::string path_list = (env != nullptr) ? env : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= path_list.size()) {
    size_t end = path_list.find(':', start);
    if (end == std::string::npos) end = path_list.size();
    std::string dir = path_list.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (is_exec(candidate)) {
      return optional<std::string>(candidate);
    }
    start = end + 1;
  }
  return optional<std::string>();
}

// ============================================================================
// RunTool
// ============================================================================

/**
 * @brief Spawn @p argv, feed it @p stdin_data, and wait for it to exit.
 *
 * @param argv            Program and arguments; argv[0] is looked up in PATH.
 * @param stdin_data      Bytes written to the child's stdin, which is then
 *                        closed (an empty string gives immediate EOF).
 * @param timeout_ms      Deadline for the whole run, I/O included.
 * @param capture_stdout  Collect stdout into ToolResult::output; stderr is
 *                        discarded in that mode.
 * @return ToolResult once the child exited (any exit code), kTimeout if it
 *         was killed at the deadline, kSpawnFailed if it never started.
 */
inline expected<ToolResult, ProcessError> RunTool(
    const std::vector<std::string>& argv, const std::string& stdin_data,
    uint32_t timeout_ms, bool capture_stdout) {
  using Result = expected<ToolResult, ProcessError>;
  if (argv.empty()) {
    return Result::error(ProcessError::kSpawnFailed);
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    cargv.push_back(const_cast<char*>(a.c_str()));
  }
  cargv.push_back(nullptr);

  detail::PipeGuard in_pipe;
  detail::PipeGuard out_pipe;
  if (!in_pipe.Create()) {
    return Result::error(ProcessError::kSpawnFailed);
  }
  if (capture_stdout && !out_pipe.Create()) {
    return Result::error(ProcessError::kSpawnFailed);
  }

  const uint64_t deadline = SteadyNowMs() + timeout_ms;

  pid_t child = ::fork();
  if (child < 0) {
    return Result::error(ProcessError::kSpawnFailed);
  }

  if (child == 0) {
    // -- Child process --
    setsid();

    // SIG_IGN and blocked masks survive exec.
    struct sigaction sa_dfl;
    std::memset(&sa_dfl, 0, sizeof(sa_dfl));
    sa_dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < 32; ++sig) {
      sigaction(sig, &sa_dfl, nullptr);
    }
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    dup2(in_pipe.ReadEnd(), STDIN_FILENO);
    if (capture_stdout) {
      dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
      int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        dup2(devnull, STDERR_FILENO);
      }
    }
    execvp(cargv[0], cargv.data());
    _exit(127);
  }

  // -- Parent process --
  in_pipe.CloseRead();
  out_pipe.CloseWrite();
  detail::SetNonBlocking(in_pipe.WriteEnd());
  if (capture_stdout) {
    detail::SetNonBlocking(out_pipe.ReadEnd());
  }
  if (stdin_data.empty()) {
    in_pipe.CloseWrite();
  }

  ToolResult result;
  size_t written = 0;
  detail::SigpipeBlock sigpipe_block;

  // Pump stdin and stdout together so a chatty child never stalls on a full
  // pipe while we are still writing.
  while (in_pipe.WriteEnd() >= 0 || out_pipe.ReadEnd() >= 0) {
    const uint64_t now = SteadyNowMs();
    if (now >= deadline) {
      detail::KillAndReap(child);
      return Result::error(ProcessError::kTimeout);
    }
    struct pollfd pfds[2];
    nfds_t nfds = 0;
    int in_idx = -1;
    int out_idx = -1;
    if (in_pipe.WriteEnd() >= 0) {
      pfds[nfds].fd = in_pipe.WriteEnd();
      pfds[nfds].events = POLLOUT;
      pfds[nfds].revents = 0;
      in_idx = static_cast<int>(nfds++);
    }
    if (out_pipe.ReadEnd() >= 0) {
      pfds[nfds].fd = out_pipe.ReadEnd();
      pfds[nfds].events = POLLIN;
      pfds[nfds].revents = 0;
      out_idx = static_cast<int>(nfds++);
    }
    int rc = ::poll(pfds, nfds, static_cast<int>(deadline - now));
    if (rc < 0) {
      if (errno == EINTR) continue;
      detail::KillAndReap(child);
      return Result::error(ProcessError::kSpawnFailed);
    }
    if (in_idx >= 0 && pfds[in_idx].revents != 0) {
      ssize_t n = ::write(in_pipe.WriteEnd(), stdin_data.data() + written,
                          stdin_data.size() - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
      }
      // EPIPE: the child does not want (more) input.
      if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
          written == stdin_data.size()) {
        in_pipe.CloseWrite();
      }
    }
    if (out_idx >= 0 && pfds[out_idx].revents != 0) {
      char buf[4096];
      ssize_t n = ::read(out_pipe.ReadEnd(), buf, sizeof(buf));
      if (n > 0) {
        result.output.append(buf, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        out_pipe.CloseRead();
      }
    }
  }

  constexpr uint32_t kPollIntervalMs = 5;
  for (;;) {
    int status;
    pid_t w = ::waitpid(child, &status, WNOHANG);
    if (w == child) {
      result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
      return Result::success(std::move(result));
    }
    if (w < 0 && errno != EINTR) {
      return Result::error(ProcessError::kSpawnFailed);
    }
    if (SteadyNowMs() >= deadline) {
      detail::KillAndReap(child);
      return Result::error(ProcessError::kTimeout);
    }
    detail::SleepMs(kPollIntervalMs);
  }
}

}  // namespace clipsync

#endif  // CLIPSYNC_PROCESS_HPP_
