/**
 * @file clipboard_watcher.hpp
 * @brief Local clipboard change detection and peer echo suppression.
 *
 * SyncState holds the two single-slot memories shared by the watcher
 * thread and the event loop. ClipboardWatcher polls the clipboard on its
 * own thread and publishes genuine local changes on the BroadcastBus.
 */

#ifndef CLIPSYNC_CLIPBOARD_WATCHER_HPP_
#define CLIPSYNC_CLIPBOARD_WATCHER_HPP_

#include "clipsync/broadcast_bus.hpp"
#include "clipsync/clipboard.hpp"
#include "clipsync/frame_codec.hpp"
#include "clipsync/log.hpp"
#include "clipsync/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace clipsync {

constexpr uint32_t kMinPollIntervalMs = 50U;

// ============================================================================
// SyncState
// ============================================================================

/**
 * @brief Last text seen locally and last text applied on behalf of a peer.
 *
 * Single-slot memory only: an A -> B -> A oscillation between two peers
 * can still cost one redundant round trip.
 */
class SyncState {
 public:
  /** @brief Record a peer value; call before writing it to the clipboard. */
  void NotePeerApplied(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_applied_from_peer_ = text;
  }

  /**
   * @brief Feed one successful clipboard read.
   *
   * Broadcast-worthy means non-empty, different from the previous read
   * and not the value a peer just pushed. A broadcast-worthy value also
   * becomes the new peer slot so it is not re-sent. last_observed is
   * updated in every case.
   * @return true if @p text should be broadcast.
   */
  bool ObserveLocal(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = !last_observed_.has_value() || last_observed_.value() != text;
    bool broadcast = changed && !text.empty() && last_applied_from_peer_ != text;
    if (broadcast) {
      last_applied_from_peer_ = text;
    }
    last_observed_ = text;
    return broadcast;
  }

  optional<std::string> LastObserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_observed_;
  }

  optional<std::string> LastAppliedFromPeer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_applied_from_peer_;
  }

 private:
  mutable std::mutex mutex_;
  optional<std::string> last_observed_;
  optional<std::string> last_applied_from_peer_;
};

// ============================================================================
// ClipboardWatcher
// ============================================================================

enum class WatcherError : uint8_t { kAlreadyRunning };

class ClipboardWatcher {
 public:
  /**
   * @param poll_interval_ms  Tick period; clamped to kMinPollIntervalMs.
   * @param read_timeout_ms   Deadline handed to ClipboardPort::ReadText.
   */
  ClipboardWatcher(ClipboardPort& clipboard, SyncState& state, BroadcastBus& bus,
                   uint32_t poll_interval_ms, uint32_t read_timeout_ms)
      : clipboard_(clipboard),
        state_(state),
        bus_(bus),
        poll_interval_ms_(poll_interval_ms < kMinPollIntervalMs
                              ? kMinPollIntervalMs
                              : poll_interval_ms),
        read_timeout_ms_(read_timeout_ms) {}

  ~ClipboardWatcher() { Stop(); }

  ClipboardWatcher(const ClipboardWatcher&) = delete;
  ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

  expected<void, WatcherError> Start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (running_.load(std::memory_order_acquire) || worker_.joinable()) {
      return expected<void, WatcherError>::error(WatcherError::kAlreadyRunning);
    }
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
      stop_requested_ = false;
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&ClipboardWatcher::WatchLoop, this);
    CLIPSYNC_LOG_INFO("Watcher", "Clipboard watcher started (poll=%ums)",
                      poll_interval_ms_);
    return expected<void, WatcherError>::success();
  }

  /**
   * @brief Interrupt the sleep and join. Safe when not running, and from
   * several threads at once: only one of them joins.
   */
  void Stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
      stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
    running_.store(false, std::memory_order_release);
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }
  uint32_t PollIntervalMs() const noexcept { return poll_interval_ms_; }

  /**
   * @brief One poll: read, apply loop prevention, publish.
   * @return true if a frame was queued.
   */
  bool Tick() {
    auto r = clipboard_.ReadText(read_timeout_ms_);
    if (!r.has_value()) {
      CLIPSYNC_LOG_DEBUG("Watcher", "Clipboard read returned not-ok (%s)",
                         ClipboardErrorToString(r.get_error()));
      return false;
    }
    const std::string& text = r.value();
    if (!state_.ObserveLocal(text)) {
      return false;
    }
    auto frame = FrameCodec::Encode(text);
    if (!frame.has_value()) {
      CLIPSYNC_LOG_WARN("Watcher", "Local clipboard change too large (%zu bytes), not sent",
                        text.size());
      return false;
    }
    if (!bus_.Publish(std::move(frame.value()))) {
      CLIPSYNC_LOG_WARN("Watcher", "Broadcast queue full, dropped local change (%zu bytes)",
                        text.size());
      return false;
    }
    CLIPSYNC_LOG_INFO("Watcher", "Queued clipboard change from PC (%zu bytes)",
                      text.size());
    return true;
  }

 private:
  void WatchLoop() {
    for (;;) {
      {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (stop_requested_) break;
      }
      Tick();
      std::unique_lock<std::mutex> lk(wait_mutex_);
      if (cv_.wait_for(lk, std::chrono::milliseconds(poll_interval_ms_),
                       [this] { return stop_requested_; })) {
        break;
      }
    }
  }

  ClipboardPort& clipboard_;
  SyncState& state_;
  BroadcastBus& bus_;
  const uint32_t poll_interval_ms_;
  const uint32_t read_timeout_ms_;

  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex wait_mutex_;
  std::mutex control_mutex_;  ///< serializes Start/Stop around worker_
  std::condition_variable cv_;
  bool stop_requested_ = false;
};

}  // namespace clipsync

#endif  // CLIPSYNC_CLIPBOARD_WATCHER_HPP_
