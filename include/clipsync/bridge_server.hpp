/**
 * @file bridge_server.hpp
 * @brief Clipboard bridge server: one event-loop thread plus the watcher.
 *
 * The event loop owns every socket. It accepts peers, pushes the current
 * clipboard to each newcomer, applies frames received from a peer to the
 * local clipboard and relays them to the other peers, and drains frames
 * queued by the ClipboardWatcher. A failing peer is dropped on its own;
 * the rest of the server carries on.
 *
 * Lifecycle: Open() -> Run() or Start() -> Stop() -> Shutdown().
 */

#ifndef CLIPSYNC_BRIDGE_SERVER_HPP_
#define CLIPSYNC_BRIDGE_SERVER_HPP_

#include "clipsync/broadcast_bus.hpp"
#include "clipsync/clipboard.hpp"
#include "clipsync/clipboard_watcher.hpp"
#include "clipsync/connection_registry.hpp"
#include "clipsync/frame_codec.hpp"
#include "clipsync/io_poller.hpp"
#include "clipsync/log.hpp"
#include "clipsync/socket.hpp"
#include "clipsync/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace clipsync {

// ============================================================================
// ServerConfig
// ============================================================================

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 28900;
  uint32_t poll_interval_ms = 300;
  int32_t backlog = kDefaultBacklog;
  uint32_t initial_push_timeout_ms = 500;
  uint32_t watch_read_timeout_ms = 1000;
  int32_t loop_timeout_ms = 1000;
  uint32_t recv_chunk = 65536;

  uint32_t EffectivePollInterval() const noexcept {
    return poll_interval_ms < kMinPollIntervalMs ? kMinPollIntervalMs
                                                 : poll_interval_ms;
  }
};

enum class ServerError : uint8_t {
  kInvalidAddress = 0,
  kSocketFailed,
  kBindFailed,
  kListenFailed,
  kPollerFailed,
  kAlreadyOpen,
  kNotOpen,
  kAlreadyRunning
};

inline const char* ServerErrorToString(ServerError e) noexcept {
  switch (e) {
    case ServerError::kInvalidAddress: return "invalid address";
    case ServerError::kSocketFailed:   return "socket failed";
    case ServerError::kBindFailed:     return "bind failed";
    case ServerError::kListenFailed:   return "listen failed";
    case ServerError::kPollerFailed:   return "poller failed";
    case ServerError::kAlreadyOpen:    return "already open";
    case ServerError::kNotOpen:        return "not open";
    case ServerError::kAlreadyRunning: return "already running";
    default:                           return "unknown";
  }
}

// ============================================================================
// BridgeServer
// ============================================================================

/// Upper bound between Stop() re-checks while Shutdown() waits on the loop.
constexpr uint32_t kShutdownRecheckMs = 50;

class BridgeServer {
 public:
  BridgeServer(const ServerConfig& cfg, ClipboardPort& clipboard)
      : cfg_(cfg),
        clipboard_(clipboard),
        watcher_(clipboard, sync_, bus_, cfg.EffectivePollInterval(),
                 cfg.watch_read_timeout_ms),
        recv_buf_(cfg.recv_chunk == 0U ? 1U : cfg.recv_chunk),
        torn_down_(false) {}

  ~BridgeServer() { Shutdown(); }

  BridgeServer(const BridgeServer&) = delete;
  BridgeServer& operator=(const BridgeServer&) = delete;

  /**
   * @brief Bind and listen. Failure here is fatal for the process.
   */
  expected<void, ServerError> Open() {
    using Result = expected<void, ServerError>;
    if (listener_.IsValid()) {
      return Result::error(ServerError::kAlreadyOpen);
    }
    if (!poller_.IsValid()) {
      return Result::error(ServerError::kPollerFailed);
    }
    auto addr = SocketAddress::Resolve(cfg_.host.c_str(), cfg_.port);
    if (!addr.has_value()) {
      CLIPSYNC_LOG_ERROR("Server", "Invalid bind address %s", cfg_.host.c_str());
      return Result::error(ServerError::kInvalidAddress);
    }
    auto created = TcpListener::Create();
    if (!created.has_value()) {
      return Result::error(ServerError::kSocketFailed);
    }
    TcpListener listener = static_cast<TcpListener&&>(created.value());
    if (!listener.SetReuseAddr(true).has_value()) {
      CLIPSYNC_LOG_WARN("Server", "SO_REUSEADDR not applied");
    }
    if (!listener.Bind(addr.value()).has_value()) {
      CLIPSYNC_LOG_ERROR("Server", "Bind to %s:%u failed: %s", cfg_.host.c_str(),
                         static_cast<unsigned>(cfg_.port), std::strerror(errno));
      return Result::error(ServerError::kBindFailed);
    }
    if (!listener.Listen(cfg_.backlog).has_value()) {
      CLIPSYNC_LOG_ERROR("Server", "Listen failed: %s", std::strerror(errno));
      return Result::error(ServerError::kListenFailed);
    }
    if (!listener.SetNonBlocking(true).has_value() ||
        !poller_.Add(listener.Fd(), static_cast<uint8_t>(IoEvent::kReadable))
             .has_value()) {
      return Result::error(ServerError::kPollerFailed);
    }
    listener_ = static_cast<TcpListener&&>(listener);
    {
      std::lock_guard<std::mutex> lock(lifecycle_mutex_);
      torn_down_ = false;
    }
    CLIPSYNC_LOG_INFO("Server", "Server listening on %s:%u", cfg_.host.c_str(),
                      static_cast<unsigned>(listener_.LocalPort()));
    return Result::success();
  }

  /**
   * @brief Run the event loop on the calling thread until Stop().
   *
   * Starts the clipboard watcher, and on exit stops it and closes every
   * connection and the listener.
   */
  expected<void, ServerError> Run() {
    auto r = MarkRunning();
    if (!r.has_value()) {
      return r;
    }
    RunLoop();
    return r;
  }

  /** @brief Run() on an owned thread. Join with Shutdown(). */
  expected<void, ServerError> Start() {
    auto r = MarkRunning();
    if (!r.has_value()) {
      return r;
    }
    loop_thread_ = std::thread(&BridgeServer::RunLoop, this);
    return r;
  }

  /** @brief Ask the loop to exit. Async-signal-safe. */
  void Stop() noexcept { stop_requested_.store(true, std::memory_order_release); }

  /**
   * @brief Stop, wait for the loop to exit and release every resource.
   *
   * Idempotent, and safe from any thread while Run() or Start() is live:
   * the loop thread tears down its own sockets, this call only waits.
   * From the loop thread itself it just requests the stop.
   */
  void Shutdown() {
    Stop();
    if (loop_thread_.joinable() &&
        loop_thread_.get_id() != std::this_thread::get_id()) {
      loop_thread_.join();
    }
    if (!WaitLoopExit()) {
      return;
    }
    watcher_.Stop();
    Teardown();
  }

  /**
   * @brief One loop iteration: wait up to @p timeout_ms, service ready
   * sockets, then flush the broadcast queue.
   * @return Number of readiness events handled.
   */
  uint32_t PollOnce(int32_t timeout_ms) {
    auto w = poller_.Wait(timeout_ms);
    if (!w.has_value()) {
      CLIPSYNC_LOG_ERROR("Server", "epoll_wait failed: %s", std::strerror(errno));
      FlushPending();
      return 0U;
    }
    const uint32_t n = w.value();
    const PollResult* results = poller_.Results();
    for (uint32_t i = 0; i < n; ++i) {
      if (listener_.IsValid() && results[i].fd == listener_.Fd()) {
        AcceptOne();
      } else {
        HandleReadable(results[i].fd);
      }
    }
    FlushPending();
    return n;
  }

  /**
   * @brief Send @p frame to every live peer except @p exclude.
   *
   * Event loop thread only. A peer whose write fails or would block is
   * dropped and the iteration continues.
   * @return Number of peers that received the frame.
   */
  uint32_t Broadcast(const EncodedFrame& frame,
                     ConnectionId exclude = ConnectionId::Invalid()) {
    uint32_t sent = 0U;
    for (const ConnectionId id : registry_.Snapshot()) {
      if (id == exclude) continue;
      ConnectionPtr conn = registry_.Find(id);
      if (conn == nullptr) continue;
      auto r = conn->socket.SendAll(frame.data(), frame.size());
      if (!r.has_value()) {
        if (r.get_error() == SocketError::kWouldBlock) {
          CLIPSYNC_LOG_INFO("Server", "Send would block -> dropping %s",
                            conn->label.c_str());
        } else {
          CLIPSYNC_LOG_INFO("Server", "Send failed -> dropping %s: %s",
                            conn->label.c_str(), std::strerror(errno));
        }
        DropConnection(id);
        continue;
      }
      ++sent;
    }
    if (sent > 0U) {
      CLIPSYNC_LOG_DEBUG("Server", "Broadcasted frame to %u client(s)", sent);
    }
    return sent;
  }

  uint16_t LocalPort() const noexcept { return listener_.LocalPort(); }
  uint32_t ClientCount() const { return registry_.Count(); }
  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  const ServerConfig& Config() const noexcept { return cfg_; }
  SyncState& Sync() noexcept { return sync_; }
  BroadcastBus& Bus() noexcept { return bus_; }
  ClipboardWatcher& Watcher() noexcept { return watcher_; }

 private:
  expected<void, ServerError> MarkRunning() {
    if (!listener_.IsValid()) {
      return expected<void, ServerError>::error(ServerError::kNotOpen);
    }
    bool expected_idle = false;
    if (!running_.compare_exchange_strong(expected_idle, true,
                                          std::memory_order_acq_rel)) {
      return expected<void, ServerError>::error(ServerError::kAlreadyRunning);
    }
    stop_requested_.store(false, std::memory_order_release);
    return expected<void, ServerError>::success();
  }

  // False when called on the loop thread, which must not wait for itself.
  bool WaitLoopExit() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    if (running_.load(std::memory_order_acquire) &&
        loop_thread_id_ == std::this_thread::get_id()) {
      return false;
    }
    while (running_.load(std::memory_order_acquire)) {
      // Re-issued: MarkRunning() may clear a Stop() that raced it.
      Stop();
      run_cv_.wait_for(lock, std::chrono::milliseconds(kShutdownRecheckMs));
    }
    return true;
  }

  void RunLoop() {
    {
      std::lock_guard<std::mutex> lock(run_mutex_);
      loop_thread_id_ = std::this_thread::get_id();
    }
    auto w = watcher_.Start();
    if (!w.has_value()) {
      CLIPSYNC_LOG_WARN("Server", "Clipboard watcher already running");
    }
    while (!stop_requested_.load(std::memory_order_acquire)) {
      PollOnce(cfg_.loop_timeout_ms);
    }
    watcher_.Stop();
    Teardown();
    {
      std::lock_guard<std::mutex> lock(run_mutex_);
      loop_thread_id_ = std::thread::id();
      running_.store(false, std::memory_order_release);
    }
    run_cv_.notify_all();
  }

  void AcceptOne() {
    SocketAddress peer;
    auto accepted = listener_.Accept(peer);
    if (!accepted.has_value()) {
      if (accepted.get_error() != SocketError::kWouldBlock) {
        CLIPSYNC_LOG_WARN("Server", "Accept failed: %s", std::strerror(errno));
      }
      return;
    }
    TcpSocket sock = static_cast<TcpSocket&&>(accepted.value());
    const std::string label = peer.ToString();
    if (!sock.SetNonBlocking(true).has_value()) {
      CLIPSYNC_LOG_WARN("Server", "Cannot make %s non-blocking, closing",
                        label.c_str());
      return;
    }
    const int32_t fd = sock.Fd();
    if (!poller_.Add(fd, static_cast<uint8_t>(IoEvent::kReadable)).has_value()) {
      CLIPSYNC_LOG_WARN("Server", "Cannot watch %s, closing", label.c_str());
      return;
    }
    auto reg = registry_.Register(static_cast<TcpSocket&&>(sock), label);
    if (!reg.has_value()) {
      CLIPSYNC_LOG_WARN("Server", "Cannot register %s, closing", label.c_str());
      UnwatchFd(fd);
      return;
    }
    CLIPSYNC_LOG_INFO("Server", "Client connected: %s (clients=%u)",
                      label.c_str(), registry_.Count());
    PushInitialClipboard(reg.value());
  }

  // A newcomer that cannot take one frame right away is not worth keeping.
  void PushInitialClipboard(ConnectionId id) {
    ConnectionPtr conn = registry_.Find(id);
    if (conn == nullptr) return;
    auto text = clipboard_.ReadText(cfg_.initial_push_timeout_ms);
    if (!text.has_value() || text.value().empty()) {
      return;
    }
    auto frame = FrameCodec::Encode(text.value());
    if (!frame.has_value()) {
      CLIPSYNC_LOG_WARN("Server", "Clipboard too large for initial push (%zu bytes)",
                        text.value().size());
      return;
    }
    auto r = conn->socket.SendAll(frame.value().data(), frame.value().size());
    if (!r.has_value()) {
      if (r.get_error() == SocketError::kWouldBlock) {
        CLIPSYNC_LOG_WARN("Server", "Initial send would block -> dropping %s",
                          conn->label.c_str());
      } else {
        CLIPSYNC_LOG_WARN("Server", "Initial send failed for %s: %s",
                          conn->label.c_str(), std::strerror(errno));
      }
      DropConnection(id);
      return;
    }
    CLIPSYNC_LOG_DEBUG("Server", "Pushed initial clipboard (%zu bytes) to %s",
                       text.value().size(), conn->label.c_str());
  }

  void HandleReadable(int32_t fd) {
    ConnectionPtr conn = registry_.FindByFd(fd);
    if (conn == nullptr) {
      UnwatchFd(fd);
      return;
    }
    auto r = conn->socket.Recv(recv_buf_.data(), recv_buf_.size());
    if (!r.has_value()) {
      if (r.get_error() == SocketError::kWouldBlock) {
        return;
      }
      CLIPSYNC_LOG_INFO("Server", "Recv error from %s: %s", conn->label.c_str(),
                        std::strerror(errno));
      DropConnection(conn->id);
      return;
    }
    if (r.value() == 0) {
      CLIPSYNC_LOG_INFO("Server", "Client closed: %s", conn->label.c_str());
      DropConnection(conn->id);
      return;
    }
    conn->reader.Feed(recv_buf_.data(), static_cast<size_t>(r.value()));
    CLIPSYNC_LOG_DEBUG("Server", "Received %d bytes from %s (buffer=%zu)",
                       r.value(), conn->label.c_str(), conn->reader.Buffered());
    ProcessFrames(*conn);
  }

  void ProcessFrames(Connection& conn) {
    for (;;) {
      auto next = conn.reader.Next();
      if (!next.has_value()) {
        CLIPSYNC_LOG_WARN("Server", "%s from %s", FrameErrorToString(next.get_error()),
                          conn.label.c_str());
        DropConnection(conn.id);
        return;
      }
      if (!next.value().has_value()) {
        return;
      }
      const std::string& text = next.value().value();
      if (!IsValidUtf8(text)) {
        CLIPSYNC_LOG_WARN("Server", "UTF-8 decode failed from %s (%zu bytes skipped)",
                          conn.label.c_str(), text.size());
        continue;
      }
      OnTextFromPeer(conn.id, text);
    }
  }

  void OnTextFromPeer(ConnectionId sender, const std::string& text) {
    // Recorded before the write so the watcher never mistakes it for a
    // local edit.
    sync_.NotePeerApplied(text);
    const bool ok = clipboard_.WriteText(text);
    CLIPSYNC_LOG_INFO("Server", "Applied text from client (%zu bytes, ok=%s)",
                      text.size(), ok ? "true" : "false");
    auto frame = FrameCodec::Encode(text);
    if (frame.has_value()) {
      Broadcast(frame.value(), sender);
    }
  }

  void FlushPending() {
    const uint32_t flushed = bus_.Drain(
        [this](const EncodedFrame& frame) { Broadcast(frame); });
    if (flushed > 0U) {
      CLIPSYNC_LOG_DEBUG("Server", "Flushed %u queued frame(s)", flushed);
    }
  }

  void DropConnection(ConnectionId id) {
    ConnectionPtr conn = registry_.Unregister(id);
    if (conn == nullptr) {
      return;
    }
    UnwatchFd(conn->socket.Fd());
    conn->socket.Close();
    CLIPSYNC_LOG_INFO("Server", "Client dropped: %s after %llu ms (clients=%u)",
                      conn->label.c_str(),
                      static_cast<unsigned long long>(conn->SessionAgeMs()),
                      registry_.Count());
  }

  void UnwatchFd(int32_t fd) {
    auto r = poller_.Remove(fd);
    if (!r.has_value()) {
      CLIPSYNC_LOG_DEBUG("Server", "fd %d was not watched", fd);
    }
  }

  void Teardown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (torn_down_ || !listener_.IsValid()) {
      return;
    }
    std::vector<ConnectionPtr> conns = registry_.Clear();
    for (auto& conn : conns) {
      UnwatchFd(conn->socket.Fd());
      conn->socket.Close();
    }
    UnwatchFd(listener_.Fd());
    listener_.Close();
    torn_down_ = true;
    CLIPSYNC_LOG_INFO("Server", "Shutdown complete, closed %zu client(s)",
                      conns.size());
  }

  ServerConfig cfg_;
  ClipboardPort& clipboard_;
  SyncState sync_;
  BroadcastBus bus_;
  ClipboardWatcher watcher_;
  ConnectionRegistry registry_;
  IoPoller poller_;
  TcpListener listener_;
  std::vector<uint8_t> recv_buf_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::thread loop_thread_;
  std::mutex run_mutex_;  ///< guards loop_thread_id_ and running_ -> false
  std::condition_variable run_cv_;
  std::thread::id loop_thread_id_;
  std::mutex lifecycle_mutex_;
  bool torn_down_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_BRIDGE_SERVER_HPP_
