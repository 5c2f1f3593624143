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
 * @file socket.hpp
 * @brief RAII TCP stream and listener sockets for the clipboard bridge.
 *
 * TcpSocket carries one peer session (either end), TcpListener accepts
 * them. Both share FdSocket for descriptor ownership and fcntl/setsockopt
 * plumbing. Errors are returned as clipsync::expected<V, SocketError>.
 */

#ifndef CLIPSYNC_SOCKET_HPP_
#define CLIPSYNC_SOCKET_HPP_

#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace clipsync {

constexpr int32_t kDefaultBacklog = 8;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kTimeout,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kWouldBlock  ///< EAGAIN: harmless on reads, a dead peer on broadcast writes
};

inline const char* SocketErrorToString(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kListenFailed:   return "listen failed";
    case SocketError::kConnectFailed:  return "connect failed";
    case SocketError::kTimeout:        return "timeout";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kAcceptFailed:   return "accept failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kWouldBlock:     return "would block";
    default:                           return "unknown";
  }
}

using SocketResult = expected<void, SocketError>;

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 endpoint; the port is kept in network byte order. */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&sin_, 0, sizeof(sin_)); }

  /** @brief Dotted-quad @p ip only; kInvalidAddress otherwise. */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress out(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &out.sin_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(out);
  }

  /** @brief Dotted-quad or host name ("localhost"), first IPv4 answer. */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    auto numeric = FromIpv4(host, port);
    if (numeric.has_value() || host == nullptr) {
      return numeric;
    }
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* list = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &list) != 0) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    SocketAddress out(port);
    bool found = false;
    for (const struct addrinfo* ai = list; ai != nullptr; ai = ai->ai_next) {
      if (ai->ai_family == AF_INET && ai->ai_addrlen >= sizeof(sockaddr_in)) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        out.sin_.sin_addr = reinterpret_cast<const sockaddr_in*>(ai->ai_addr)->sin_addr;
        found = true;
        break;
      }
    }
    ::freeaddrinfo(list);
    if (!found) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(out);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept { return reinterpret_cast<const sockaddr*>(&sin_); }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&sin_); }
  socklen_t Size() const noexcept { return static_cast<socklen_t>(sizeof(sin_)); }

  uint16_t Port() const noexcept { return ntohs(sin_.sin_port); }

  /** @brief "a.b.c.d:port", the peer label used in log lines. */
  std::string ToString() const {
    char ip[INET_ADDRSTRLEN] = "?";
    (void)::inet_ntop(AF_INET, &sin_.sin_addr, ip, sizeof(ip));
    char label[INET_ADDRSTRLEN + 8];
    (void)std::snprintf(label, sizeof(label), "%s:%u", ip,
                        static_cast<unsigned>(Port()));
    return std::string(label);
  }

 private:
  explicit SocketAddress(uint16_t port) noexcept : SocketAddress() {
    sin_.sin_family = AF_INET;
    sin_.sin_port = htons(port);
  }

  sockaddr_in sin_;
};

// ============================================================================
// FdSocket - shared descriptor ownership
// ============================================================================

/**
 * @brief Move-only owner of one socket descriptor.
 *
 * The descriptor is closed on destruction or Close(); Close() may be called
 * any number of times.
 */
class FdSocket {
 public:
  FdSocket(const FdSocket&) = delete;
  FdSocket& operator=(const FdSocket&) = delete;

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

  void Close() noexcept {
    if (fd_ >= 0) {
      (void)::close(fd_);
      fd_ = -1;
    }
  }

  SocketResult SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return SocketResult::error(SocketError::kInvalidFd);
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return SocketResult::error(SocketError::kSetOptFailed);
    }
    const int wanted = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (wanted != flags && ::fcntl(fd_, F_SETFL, wanted) < 0) {
      return SocketResult::error(SocketError::kSetOptFailed);
    }
    return SocketResult::success();
  }

 protected:
  FdSocket() noexcept : fd_(-1) {}
  explicit FdSocket(int32_t fd) noexcept : fd_(fd) {}
  ~FdSocket() { Close(); }

  FdSocket(FdSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  FdSocket& operator=(FdSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  static int32_t OpenStream() noexcept {
    return ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  }

  SocketResult SetIntOption(int level, int name, bool enable) noexcept {
    if (fd_ < 0) {
      return SocketResult::error(SocketError::kInvalidFd);
    }
    const int value = enable ? 1 : 0;
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return SocketResult::error(SocketError::kSetOptFailed);
    }
    return SocketResult::success();
  }

  int32_t fd_;
};

class TcpListener;

// ============================================================================
// TcpSocket
// ============================================================================

class TcpSocket final : public FdSocket {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    const int32_t fd = OpenStream();
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /** @brief Blocking connect. */
  SocketResult Connect(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return SocketResult::error(SocketError::kInvalidFd);
    }
    int rc;
    do {
      rc = ::connect(fd_, addr.Raw(), addr.Size());
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
      return SocketResult::error(SocketError::kConnectFailed);
    }
    return SocketResult::success();
  }

  /**
   * @brief Connect, giving up after @p timeout_ms.
   *
   * The handshake runs non-blocking; the socket is blocking again on
   * success.
   */
  SocketResult Connect(const SocketAddress& addr, uint32_t timeout_ms) noexcept {
    auto nb = SetNonBlocking(true);
    if (!nb.has_value()) {
      return nb;
    }
    if (::connect(fd_, addr.Raw(), addr.Size()) < 0) {
      if (errno != EINPROGRESS) {
        return SocketResult::error(SocketError::kConnectFailed);
      }
      const int ready = PollFor(POLLOUT, static_cast<int32_t>(timeout_ms));
      if (ready == 0) {
        return SocketResult::error(SocketError::kTimeout);
      }
      int so_error = 0;
      socklen_t len = static_cast<socklen_t>(sizeof(so_error));
      if (ready < 0 ||
          ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
          so_error != 0) {
        return SocketResult::error(SocketError::kConnectFailed);
      }
    }
    return SetNonBlocking(false);
  }

  /** @return Bytes written; never raises SIGPIPE. */
  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::send(fd_, data, len, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          IsWouldBlock() ? SocketError::kWouldBlock : SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /**
   * @brief Write all of @p data.
   *
   * On a non-blocking socket a full send buffer ends the call with
   * kWouldBlock, possibly after a prefix was written.
   */
  SocketResult SendAll(const void* data, size_t len) noexcept {
    const auto* cursor = static_cast<const uint8_t*>(data);
    size_t left = len;
    while (left > 0U) {
      auto r = Send(cursor, left);
      if (!r.has_value()) {
        return SocketResult::error(r.get_error());
      }
      cursor += r.value();
      left -= static_cast<size_t>(r.value());
    }
    return SocketResult::success();
  }

  /** @return Bytes read; 0 means the peer closed its side. */
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::recv(fd_, buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          IsWouldBlock() ? SocketError::kWouldBlock : SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /** @brief True once data, EOF or an error is pending (-1 waits forever). */
  bool WaitReadable(int32_t timeout_ms) const noexcept {
    return fd_ >= 0 && PollFor(POLLIN, timeout_ms) > 0;
  }

  SocketResult SetNoDelay(bool enable) noexcept {
    return SetIntOption(IPPROTO_TCP, TCP_NODELAY, enable);
  }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : FdSocket(fd) {}

  static bool IsWouldBlock() noexcept {
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }

  int PollFor(short events, int32_t timeout_ms) const noexcept {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = events;
    pfd.revents = 0;
    int rc;
    do {
      rc = ::poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    return rc;
  }
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener final : public FdSocket {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static expected<TcpListener, SocketError> Create() noexcept {
    const int32_t fd = OpenStream();
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }

  SocketResult SetReuseAddr(bool enable) noexcept {
    return SetIntOption(SOL_SOCKET, SO_REUSEADDR, enable);
  }

  SocketResult Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return SocketResult::error(SocketError::kInvalidFd);
    }
    return ::bind(fd_, addr.Raw(), addr.Size()) == 0
               ? SocketResult::success()
               : SocketResult::error(SocketError::kBindFailed);
  }

  SocketResult Listen(int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return SocketResult::error(SocketError::kInvalidFd);
    }
    return ::listen(fd_, backlog) == 0
               ? SocketResult::success()
               : SocketResult::error(SocketError::kListenFailed);
  }

  /**
   * @brief Take the next pending connection.
   * @param[out] peer Remote endpoint of the accepted connection.
   * @return kWouldBlock on a non-blocking listener with an empty backlog.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& peer) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t peer_len = peer.Size();
    int32_t fd;
    do {
      fd = ::accept4(fd_, peer.RawMut(), &peer_len, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(
          (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kWouldBlock
                                                    : SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /** @brief Bound port, resolved by the kernel when bound to port 0. */
  uint16_t LocalPort() const noexcept {
    SocketAddress local;
    socklen_t len = local.Size();
    if (fd_ < 0 || ::getsockname(fd_, local.RawMut(), &len) != 0) {
      return 0;
    }
    return local.Port();
  }

 private:
  explicit TcpListener(int32_t fd) noexcept : FdSocket(fd) {}
};

}  // namespace clipsync

#endif  // CLIPSYNC_SOCKET_HPP_
