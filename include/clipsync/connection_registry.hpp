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
 * @file connection_registry.hpp
 * @brief Thread-safe registry of live peer connections.
 *
 * The mutex guards the maps only. Callers take a Snapshot() or a
 * shared_ptr to a Connection and do socket I/O without the lock.
 */

#ifndef CLIPSYNC_CONNECTION_REGISTRY_HPP_
#define CLIPSYNC_CONNECTION_REGISTRY_HPP_

#include "clipsync/frame_codec.hpp"
#include "clipsync/platform.hpp"
#include "clipsync/socket.hpp"
#include "clipsync/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Error Enum
// ============================================================================

enum class ConnectionError : uint8_t { kInvalidSocket, kAlreadyExists };

// ============================================================================
// ConnectionId (strong type)
// ============================================================================

/// Monotonic per registry; never reused, unlike the fd behind it.
struct ConnectionId {
  uint32_t value;

  bool operator==(const ConnectionId& other) const { return value == other.value; }
  bool operator!=(const ConnectionId& other) const { return value != other.value; }
  bool operator<(const ConnectionId& other) const { return value < other.value; }

  static ConnectionId Invalid() { return {UINT32_MAX}; }
  bool IsValid() const { return value != UINT32_MAX; }
};

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief One peer session.
 *
 * The receive buffer is touched only by the event loop thread. The socket
 * closes when the last shared_ptr goes away.
 */
struct Connection {
  ConnectionId id;
  TcpSocket socket;
  std::string label;  ///< remote "ip:port"
  FrameReader reader;
  uint64_t connected_ms;

  Connection(ConnectionId cid, TcpSocket&& sock, std::string peer_label)
      : id(cid),
        socket(static_cast<TcpSocket&&>(sock)),
        label(std::move(peer_label)),
        connected_ms(SteadyNowMs()) {}

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  uint64_t SessionAgeMs() const noexcept { return SteadyNowMs() - connected_ms; }
};

using ConnectionPtr = std::shared_ptr<Connection>;

// ============================================================================
// ConnectionRegistry
// ============================================================================

class ConnectionRegistry {
 public:
  ConnectionRegistry() : next_id_(0U) {}

  ConnectionRegistry(const ConnectionRegistry&) = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  /**
   * @brief Take ownership of a connected socket.
   * @return The new ConnectionId; kInvalidSocket for a closed socket,
   *         kAlreadyExists if the fd is already registered.
   */
  expected<ConnectionId, ConnectionError> Register(TcpSocket&& sock,
                                                   std::string label) {
    if (!sock.IsValid()) {
      return expected<ConnectionId, ConnectionError>::error(
          ConnectionError::kInvalidSocket);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (by_fd_.find(sock.Fd()) != by_fd_.end()) {
      return expected<ConnectionId, ConnectionError>::error(
          ConnectionError::kAlreadyExists);
    }
    ConnectionId id{next_id_++};
    auto conn = std::make_shared<Connection>(
        id, static_cast<TcpSocket&&>(sock), std::move(label));
    by_fd_[conn->socket.Fd()] = id;
    by_id_[id] = std::move(conn);
    return expected<ConnectionId, ConnectionError>::success(id);
  }

  /**
   * @brief Remove a connection.
   * @return The removed connection, or nullptr if it was not registered.
   */
  ConnectionPtr Unregister(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
      return nullptr;
    }
    ConnectionPtr conn = std::move(it->second);
    by_id_.erase(it);
    by_fd_.erase(conn->socket.Fd());
    return conn;
  }

  ConnectionPtr Find(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    return (it == by_id_.end()) ? nullptr : it->second;
  }

  ConnectionPtr FindByFd(int32_t fd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fit = by_fd_.find(fd);
    if (fit == by_fd_.end()) {
      return nullptr;
    }
    auto it = by_id_.find(fit->second);
    return (it == by_id_.end()) ? nullptr : it->second;
  }

  /** @brief Point-in-time copy of live ids, oldest connection first. */
  std::vector<ConnectionId> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionId> ids;
    ids.reserve(by_id_.size());
    for (const auto& kv : by_id_) {
      ids.push_back(kv.first);
    }
    return ids;
  }

  /** @brief Remove everything; returns the removed connections. */
  std::vector<ConnectionPtr> Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionPtr> out;
    out.reserve(by_id_.size());
    for (auto& kv : by_id_) {
      out.push_back(std::move(kv.second));
    }
    by_id_.clear();
    by_fd_.clear();
    return out;
  }

  uint32_t Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(by_id_.size());
  }

  bool IsEmpty() const { return Count() == 0U; }

 private:
  mutable std::mutex mutex_;
  std::map<ConnectionId, ConnectionPtr> by_id_;
  std::map<int32_t, ConnectionId> by_fd_;
  uint32_t next_id_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_CONNECTION_REGISTRY_HPP_
