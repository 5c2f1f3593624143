/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the clipsync executables.
 *
 * The signal handler only sets a flag and writes one byte to a self-pipe;
 * WaitForShutdown() wakes on that byte and runs the registered callbacks
 * in LIFO order on the waiting thread.
 */

#ifndef CLIPSYNC_SHUTDOWN_HPP_
#define CLIPSYNC_SHUTDOWN_HPP_

#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <functional>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace clipsync {

enum class ShutdownError : uint8_t {
  kInvalidCallback = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Cleanup callback. Receives the signal number (0 for Quit()).
using ShutdownFn = std::function<void(int signo)>;

class ShutdownManager;

namespace detail {

// Exactly one ShutdownManager may own the signal handlers per process.
inline std::atomic<ShutdownManager*>& ShutdownInstance() {
  static std::atomic<ShutdownManager*> ptr{nullptr};
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide graceful shutdown.
 *
 * @code
 *   clipsync::ShutdownManager mgr;
 *   mgr.Register([&server](int) { server.Shutdown(); });
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 *
 * A second instance constructed while the first is alive is invalid:
 * every call on it fails with kAlreadyInstantiated.
 */
class ShutdownManager final {
 public:
  ShutdownManager() noexcept : shutdown_flag_(false), valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    ShutdownManager* expected_null = nullptr;
    if (!detail::ShutdownInstance().compare_exchange_strong(expected_null, this)) {
      return;
    }
    if (::pipe2(pipe_fd_, O_CLOEXEC | O_NONBLOCK) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    ShutdownManager* self = this;
    detail::ShutdownInstance().compare_exchange_strong(self, nullptr);
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /** @brief Add a cleanup callback; callbacks run last-registered first. */
  expected<void, ShutdownError> Register(ShutdownFn fn) {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (!fn) {
      return expected<void, ShutdownError>::error(ShutdownError::kInvalidCallback);
    }
    callbacks_.push_back(std::move(fn));
    return expected<void, ShutdownError>::success();
  }

  /**
   * @brief Route SIGINT/SIGTERM to this manager and ignore SIGPIPE, so a
   * vanished peer surfaces as EPIPE instead of killing the process.
   */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    ::sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    if (::sigaction(SIGPIPE, &ign, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Trigger shutdown from code. Async-signal-safe. */
  void Quit(int signo = 0) noexcept { Trigger(signo); }

  /**
   * @brief Block until a signal or Quit(), then run callbacks LIFO.
   * Callbacks run at most once per manager.
   */
  void WaitForShutdown() {
    while (pipe_fd_[0] >= 0 && !shutdown_flag_.load(std::memory_order_acquire)) {
      struct pollfd pfd;
      pfd.fd = pipe_fd_[0];
      pfd.events = POLLIN;
      pfd.revents = 0;
      int rc = ::poll(&pfd, 1, -1);
      if (rc < 0 && errno != EINTR) break;
    }
    RunCallbacks();
  }

  bool IsShutdownRequested() const noexcept {
    return shutdown_flag_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::ShutdownInstance().load();
    if (self != nullptr) {
      self->Trigger(signo);
    }
  }

  void Trigger(int signo) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
    }
    if (pipe_fd_[1] >= 0) {
      const int saved_errno = errno;
      const uint8_t byte = 1;
      // A full pipe already carries a wakeup.
      ssize_t n = ::write(pipe_fd_[1], &byte, 1);
      (void)n;
      errno = saved_errno;
    }
  }

  void RunCallbacks() {
    bool expected_val = false;
    if (!callbacks_ran_.compare_exchange_strong(expected_val, true)) {
      return;
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    for (size_t i = callbacks_.size(); i > 0U; --i) {
      callbacks_[i - 1U](signo);
    }
  }

  std::vector<ShutdownFn> callbacks_;
  std::atomic<bool> shutdown_flag_;
  std::atomic<bool> callbacks_ran_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_SHUTDOWN_HPP_
