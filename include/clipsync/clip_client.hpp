/**
 * @file clip_client.hpp
 * @brief Peer side of the bridge: connect, send text, apply received text.
 *
 * With auto_reconnect set, a lost or refused connection is retried by
 * probing the server every retry_interval_ms and reconnecting once it
 * answers.
 */

#ifndef CLIPSYNC_CLIP_CLIENT_HPP_
#define CLIPSYNC_CLIP_CLIENT_HPP_

#include "clipsync/clipboard.hpp"
#include "clipsync/frame_codec.hpp"
#include "clipsync/log.hpp"
#include "clipsync/socket.hpp"
#include "clipsync/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// ClientConfig
// ============================================================================

struct ClientConfig {
  std::string host = "192.168.0.100";
  uint16_t port = 28900;
  uint32_t connect_timeout_ms = 5000;
  bool auto_reconnect = false;
  uint32_t probe_timeout_ms = 1200;
  uint32_t retry_interval_ms = 3000;
};

enum class ClientError : uint8_t {
  kInvalidAddress = 0,
  kConnectFailed,
  kTooLarge,
  kNotConnected,
  kSendFailed,
  kTimeout,
  kClosed,
  kProtocol
};

inline const char* ClientErrorToString(ClientError e) noexcept {
  switch (e) {
    case ClientError::kInvalidAddress: return "invalid address";
    case ClientError::kConnectFailed:  return "connect failed";
    case ClientError::kTooLarge:       return "payload too large";
    case ClientError::kNotConnected:   return "not connected";
    case ClientError::kSendFailed:     return "send failed";
    case ClientError::kTimeout:        return "timeout";
    case ClientError::kClosed:         return "connection closed";
    case ClientError::kProtocol:       return "protocol error";
    default:                           return "unknown";
  }
}

enum class ClientStatus : uint8_t {
  kDisconnected = 0,
  kConnecting,
  kConnected,
  kWaiting  ///< auto-reconnect: waiting for the server to become reachable
};

inline const char* ClientStatusToString(ClientStatus s) noexcept {
  switch (s) {
    case ClientStatus::kDisconnected: return "Disconnected";
    case ClientStatus::kConnecting:   return "Connecting";
    case ClientStatus::kConnected:    return "Connected";
    case ClientStatus::kWaiting:      return "Waiting";
    default:                          return "Unknown";
  }
}

// ============================================================================
// ClipClient
// ============================================================================

class ClipClient {
 public:
  /// Receive slice used by Run() so Stop() is noticed promptly.
  static constexpr int32_t kReceiveSliceMs = 500;

  ClipClient(const ClientConfig& cfg, ClipboardPort& clipboard)
      : cfg_(cfg), clipboard_(clipboard), recv_buf_(4096) {}

  ~ClipClient() { Disconnect(); }

  ClipClient(const ClipClient&) = delete;
  ClipClient& operator=(const ClipClient&) = delete;

  /** @brief Connect with cfg.connect_timeout_ms as the handshake bound. */
  expected<void, ClientError> Connect() {
    using Result = expected<void, ClientError>;
    Disconnect();
    SetStatus(ClientStatus::kConnecting);
    auto addr = SocketAddress::Resolve(cfg_.host.c_str(), cfg_.port);
    if (!addr.has_value()) {
      SetStatus(ClientStatus::kDisconnected);
      return Result::error(ClientError::kInvalidAddress);
    }
    auto created = TcpSocket::Create();
    if (!created.has_value()) {
      SetStatus(ClientStatus::kDisconnected);
      return Result::error(ClientError::kConnectFailed);
    }
    TcpSocket sock = static_cast<TcpSocket&&>(created.value());
    auto c = sock.Connect(addr.value(), cfg_.connect_timeout_ms);
    if (!c.has_value()) {
      CLIPSYNC_LOG_DEBUG("Client", "connect %s:%u: %s", cfg_.host.c_str(),
                         static_cast<unsigned>(cfg_.port),
                         SocketErrorToString(c.get_error()));
      SetStatus(ClientStatus::kDisconnected);
      return Result::error(ClientError::kConnectFailed);
    }
    if (!sock.SetNoDelay(true).has_value()) {
      CLIPSYNC_LOG_DEBUG("Client", "TCP_NODELAY not applied");
    }
    {
      std::lock_guard<std::mutex> lock(send_mutex_);
      socket_ = static_cast<TcpSocket&&>(sock);
    }
    reader_.Clear();
    SetStatus(ClientStatus::kConnected);
    return Result::success();
  }

  void Disconnect() {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (socket_.IsValid()) {
      socket_.Close();
      SetStatus(ClientStatus::kDisconnected);
    }
  }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return socket_.IsValid();
  }

  /** @brief Frame and send @p text in full. */
  expected<void, ClientError> SendText(const std::string& text) {
    using Result = expected<void, ClientError>;
    auto frame = FrameCodec::Encode(text);
    if (!frame.has_value()) {
      return Result::error(ClientError::kTooLarge);
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!socket_.IsValid()) {
      return Result::error(ClientError::kNotConnected);
    }
    auto r = socket_.SendAll(frame.value().data(), frame.value().size());
    if (!r.has_value()) {
      CLIPSYNC_LOG_WARN("Client", "Send failed: %s", SocketErrorToString(r.get_error()));
      return Result::error(ClientError::kSendFailed);
    }
    CLIPSYNC_LOG_DEBUG("Client", "Sent %zu bytes", text.size());
    return Result::success();
  }

  /**
   * @brief Next text frame from the server.
   * @param timeout_ms  Upper bound on the wait; negative waits forever.
   * @return kTimeout, kClosed (peer closed or read error) or kProtocol
   *         (bad frame; the connection is closed).
   */
  expected<std::string, ClientError> ReceiveText(int32_t timeout_ms) {
    using Result = expected<std::string, ClientError>;
    if (!IsConnected()) {
      return Result::error(ClientError::kNotConnected);
    }
    const uint64_t deadline = SteadyNowMs() + static_cast<uint64_t>(
                                                  timeout_ms < 0 ? 0 : timeout_ms);
    for (;;) {
      auto next = reader_.Next();
      if (!next.has_value()) {
        CLIPSYNC_LOG_WARN("Client", "%s from server", FrameErrorToString(next.get_error()));
        Disconnect();
        return Result::error(ClientError::kProtocol);
      }
      if (next.value().has_value()) {
        std::string& text = next.value().value();
        if (!IsValidUtf8(text)) {
          CLIPSYNC_LOG_WARN("Client", "UTF-8 decode failed (%zu bytes skipped)",
                            text.size());
          continue;
        }
        return Result::success(std::move(text));
      }
      int32_t wait_ms = -1;
      if (timeout_ms >= 0) {
        const uint64_t now = SteadyNowMs();
        if (now >= deadline) {
          return Result::error(ClientError::kTimeout);
        }
        wait_ms = static_cast<int32_t>(deadline - now);
      }
      if (!socket_.WaitReadable(wait_ms)) {
        return Result::error(ClientError::kTimeout);
      }
      auto r = socket_.Recv(recv_buf_.data(), recv_buf_.size());
      if (!r.has_value()) {
        if (r.get_error() == SocketError::kWouldBlock) continue;
        Disconnect();
        return Result::error(ClientError::kClosed);
      }
      if (r.value() == 0) {
        Disconnect();
        return Result::error(ClientError::kClosed);
      }
      reader_.Feed(recv_buf_.data(), static_cast<size_t>(r.value()));
    }
  }

  /**
   * @brief Receive loop: every text from the server goes to the local
   * clipboard. Returns on Stop(), or on the first failure when
   * auto_reconnect is off.
   */
  expected<void, ClientError> Run() {
    using Result = expected<void, ClientError>;
    stop_requested_.store(false, std::memory_order_release);
    while (!stop_requested_.load(std::memory_order_acquire)) {
      if (!IsConnected()) {
        auto c = Connect();
        if (!c.has_value()) {
          if (!cfg_.auto_reconnect) {
            return c;
          }
          WaitUntilReachable();
          continue;
        }
      }
      auto r = ReceiveText(kReceiveSliceMs);
      if (r.has_value()) {
        const bool ok = clipboard_.WriteText(r.value());
        CLIPSYNC_LOG_INFO("Client", "Applied text from server (%zu bytes, ok=%s)",
                          r.value().size(), ok ? "true" : "false");
        continue;
      }
      if (r.get_error() == ClientError::kTimeout) {
        continue;
      }
      CLIPSYNC_LOG_INFO("Client", "Connection lost: %s",
                        ClientErrorToString(r.get_error()));
      if (!cfg_.auto_reconnect) {
        return Result::error(r.get_error());
      }
      WaitUntilReachable();
    }
    Disconnect();
    return Result::success();
  }

  /** @brief End Run() within one receive slice. */
  void Stop() {
    stop_requested_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(wait_mutex_);
    cv_.notify_all();
  }

  /**
   * @brief Cheap reachability check: open and immediately close a TCP
   * connection to @p host:@p port.
   */
  static bool Probe(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    auto addr = SocketAddress::Resolve(host.c_str(), port);
    if (!addr.has_value()) return false;
    auto created = TcpSocket::Create();
    if (!created.has_value()) return false;
    return created.value().Connect(addr.value(), timeout_ms).has_value();
  }

  ClientStatus Status() const noexcept { return status_.load(std::memory_order_acquire); }
  const ClientConfig& Config() const noexcept { return cfg_; }

 private:
  void SetStatus(ClientStatus s) {
    ClientStatus prev = status_.exchange(s, std::memory_order_acq_rel);
    if (prev == s) return;
    switch (s) {
      case ClientStatus::kConnecting:
        CLIPSYNC_LOG_INFO("Client", "Connecting to %s:%u", cfg_.host.c_str(),
                          static_cast<unsigned>(cfg_.port));
        break;
      case ClientStatus::kConnected:
        CLIPSYNC_LOG_INFO("Client", "Connected to %s:%u", cfg_.host.c_str(),
                          static_cast<unsigned>(cfg_.port));
        break;
      case ClientStatus::kWaiting:
        CLIPSYNC_LOG_INFO("Client", "Waiting for %s:%u", cfg_.host.c_str(),
                          static_cast<unsigned>(cfg_.port));
        break;
      default:
        CLIPSYNC_LOG_INFO("Client", "Disconnected");
        break;
    }
  }

  // Returns when the server answers a probe or Stop() is called.
  void WaitUntilReachable() {
    SetStatus(ClientStatus::kWaiting);
    while (!stop_requested_.load(std::memory_order_acquire)) {
      if (Probe(cfg_.host, cfg_.port, cfg_.probe_timeout_ms)) {
        return;
      }
      std::unique_lock<std::mutex> lk(wait_mutex_);
      cv_.wait_for(lk, std::chrono::milliseconds(cfg_.retry_interval_ms), [this] {
        return stop_requested_.load(std::memory_order_acquire);
      });
    }
  }

  ClientConfig cfg_;
  ClipboardPort& clipboard_;
  TcpSocket socket_;
  FrameReader reader_;
  std::vector<uint8_t> recv_buf_;

  mutable std::mutex send_mutex_;
  std::mutex wait_mutex_;
  std::condition_variable cv_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<ClientStatus> status_{ClientStatus::kDisconnected};
};

}  // namespace clipsync

#endif  // CLIPSYNC_CLIP_CLIENT_HPP_
