/**
 * @file io_poller.hpp
 * @brief Level-triggered epoll wrapper driving the bridge event loop.
 *
 * A readiness notification repeats until the fd is drained, so a handler
 * may consume one chunk per wakeup.
 */

#ifndef CLIPSYNC_IO_POLLER_HPP_
#define CLIPSYNC_IO_POLLER_HPP_

#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <sys/epoll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>

namespace clipsync {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t mask, IoEvent ev) {
  return (mask & static_cast<uint8_t>(ev)) != 0U;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

#ifndef CLIPSYNC_IO_POLLER_MAX_EVENTS
#define CLIPSYNC_IO_POLLER_MAX_EVENTS 64U
#endif

class IoPoller {
 public:
  IoPoller() noexcept
      : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)), results_{}, result_count_(0) {}

  ~IoPoller() {
    if (poller_fd_ >= 0) {
      ::close(poller_fd_);
    }
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }
  int32_t Fd() const noexcept { return poller_fd_; }

  /** @brief Watch @p fd; only kReadable is requested, errors always report. */
  expected<void, PollerError> Add(int32_t fd, uint8_t events) {
    return Control(EPOLL_CTL_ADD, fd, events, PollerError::kAddFailed);
  }

  /** @brief Remove an fd from monitoring. */
  expected<void, PollerError> Remove(int32_t fd) {
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for events into the internal buffer.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready events; an interrupted wait reports zero.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    struct epoll_event raw[CLIPSYNC_IO_POLLER_MAX_EVENTS];
    int32_t n = ::epoll_wait(poller_fd_, raw,
                             static_cast<int32_t>(CLIPSYNC_IO_POLLER_MAX_EVENTS),
                             timeout_ms);
    if (n < 0) {
      result_count_ = 0;
      if (errno == EINTR) {
        return expected<uint32_t, PollerError>::success(0U);
      }
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    result_count_ = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < result_count_; ++i) {
      results_[i].fd = raw[i].data.fd;
      results_[i].events = FromEpoll(raw[i].events);
    }
    return expected<uint32_t, PollerError>::success(result_count_);
  }

  /** @brief Results from the last Wait() call. */
  const PollResult* Results() const noexcept { return results_.data(); }
  uint32_t ResultCount() const noexcept { return result_count_; }

 private:
  expected<void, PollerError> Control(int op, int32_t fd, uint8_t events,
                                      PollerError on_fail) {
    struct epoll_event ev {};
    ev.events = ToEpoll(events);
    ev.data.fd = fd;
    if (::epoll_ctl(poller_fd_, op, fd, &ev) != 0) {
      return expected<void, PollerError>::error(on_fail);
    }
    return expected<void, PollerError>::success();
  }

  static uint32_t ToEpoll(uint8_t events) {
    uint32_t ep = 0;
    if (HasEvent(events, IoEvent::kReadable)) ep |= EPOLLIN;
    return ep;
  }

  static uint8_t FromEpoll(uint32_t ep) {
    uint8_t ev = 0;
    if (ep & EPOLLIN)  ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if (ep & EPOLLERR) ev |= static_cast<uint8_t>(IoEvent::kError);
    if (ep & EPOLLHUP) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    return ev;
  }

  int32_t poller_fd_;
  std::array<PollResult, CLIPSYNC_IO_POLLER_MAX_EVENTS> results_;
  uint32_t result_count_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_IO_POLLER_HPP_
