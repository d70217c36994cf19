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
 * @brief POSIX TCP socket RAII abstractions.
 *
 * Header-only, C++17. Provides TcpSocket and TcpListener with RAII fd
 * ownership, and SocketAddress as a thin wrapper around sockaddr_in.
 * All errors are returned via ferry::expected<V,E>.
 */

#ifndef FERRY_SOCKET_HPP_
#define FERRY_SOCKET_HPP_

#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace ferry {

// ============================================================================
// Constants
// ============================================================================

constexpr int32_t kDefaultBacklog = 16;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kResolveFailed,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kTimeout,
  kSendFailed,
  kRecvFailed,
  kClosed,       ///< Peer closed the stream (EOF or EPIPE/ECONNRESET).
  kAcceptFailed,
  kSetOptFailed,
  kWouldBlock    ///< EAGAIN/EWOULDBLOCK -- transient, caller may retry.
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:     return "invalid fd";
    case SocketError::kResolveFailed: return "resolve failed";
    case SocketError::kBindFailed:    return "bind failed";
    case SocketError::kListenFailed:  return "listen failed";
    case SocketError::kConnectFailed: return "connect failed";
    case SocketError::kTimeout:       return "timeout";
    case SocketError::kSendFailed:    return "send failed";
    case SocketError::kRecvFailed:    return "recv failed";
    case SocketError::kClosed:        return "closed by peer";
    case SocketError::kAcceptFailed:  return "accept failed";
    case SocketError::kSetOptFailed:  return "setsockopt failed";
    case SocketError::kWouldBlock:    return "would block";
    default:                          return "unknown";
  }
}

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 endpoint (sockaddr_in). */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief Numeric IPv4 address; no name lookup (see Resolve()).
   * @param port Host byte order.
   * @return kResolveFailed if @p ip is not a dotted quad.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kResolveFailed);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /**
   * @brief Resolve a host name or IPv4 literal through getaddrinfo(3).
   *
   * The first IPv4 result is used.
   */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    auto literal = FromIpv4(host, port);
    if (literal.has_value()) return literal;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kResolveFailed);
    }
    SocketAddress sa;
    std::memcpy(&sa.addr_, res->ai_addr, sizeof(sa.addr_));
    sa.addr_.sin_port = htons(port);
    ::freeaddrinfo(res);
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  /** @brief Port, host byte order. */
  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /** @brief Write "a.b.c.d:port" into @p buf. */
  void Format(char* buf, size_t size) const noexcept {
    char ip[INET_ADDRSTRLEN] = {};
    (void)::inet_ntop(AF_INET, &addr_.sin_addr, ip, sizeof(ip));
    (void)std::snprintf(buf, size, "%s:%u", ip,
                        static_cast<unsigned>(Port()));
  }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief Connected TCP stream, one per sender destination or receiver session.
 *
 * Sole owner of its fd; moving transfers ownership and the destructor
 * closes it.
 */
class TcpSocket {
 public:
  TcpSocket() noexcept : fd_(-1) {}

  ~TcpSocket() { Close(); }

  TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpSocket& operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;


  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }


  expected<void, SocketError> Connect(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::connect(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kConnectFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Connect, giving up after @p timeout_ms (0 = block until the
   * kernel gives up).
   *
   * The socket is left in blocking mode on return.
   */
  expected<void, SocketError> Connect(const SocketAddress& addr,
                                      uint32_t timeout_ms) noexcept {
    if (timeout_ms == 0U) return Connect(addr);
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (!SetNonBlocking(true).has_value()) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    int32_t rc = ::connect(fd_, addr.Raw(), addr.Size());
    if (rc < 0 && errno != EINPROGRESS) {
      (void)SetNonBlocking(false);
      return expected<void, SocketError>::error(SocketError::kConnectFailed);
    }
    if (rc < 0) {
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      int32_t n;
      do {
        n = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
      } while (n < 0 && errno == EINTR);
      if (n == 0) {
        (void)SetNonBlocking(false);
        return expected<void, SocketError>::error(SocketError::kTimeout);
      }
      int32_t so_error = 0;
      socklen_t len = static_cast<socklen_t>(sizeof(so_error));
      if (n < 0 ||
          ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
          so_error != 0) {
        (void)SetNonBlocking(false);
        return expected<void, SocketError>::error(SocketError::kConnectFailed);
      }
    }
    if (!SetNonBlocking(false).has_value()) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        return expected<int32_t, SocketError>::error(SocketError::kClosed);
      }
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::recv(fd_, buf, len, 0);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<int32_t, SocketError>::error(SocketError::kWouldBlock);
      }
      if (errno == ECONNRESET) {
        return expected<int32_t, SocketError>::error(SocketError::kClosed);
      }
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /**
   * @brief Write all @p len bytes, looping over partial sends and EINTR.
   */
  expected<void, SocketError> SendAll(const void* data, size_t len) noexcept {
    const auto* p = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < len) {
      auto r = Send(p + sent, len - sent);
      if (!r.has_value()) {
        if (errno == EINTR && r.get_error() == SocketError::kSendFailed) {
          continue;
        }
        if (r.get_error() == SocketError::kWouldBlock) {
          // SO_SNDTIMEO expired on a blocking socket.
          return expected<void, SocketError>::error(SocketError::kTimeout);
        }
        return expected<void, SocketError>::error(r.get_error());
      }
      sent += static_cast<size_t>(r.value());
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Read until @p len bytes have arrived or the peer closes.
   *
   * @return Number of bytes read. Less than @p len only when the peer
   *         closed the stream; 0 means it closed before sending anything.
   */
  expected<size_t, SocketError> RecvAll(void* buf, size_t len) noexcept {
    auto* p = static_cast<uint8_t*>(buf);
    size_t got = 0;
    while (got < len) {
      auto r = Recv(p + got, len - got);
      if (!r.has_value()) {
        if (errno == EINTR && r.get_error() == SocketError::kRecvFailed) {
          continue;
        }
        if (r.get_error() == SocketError::kWouldBlock) {
          // SO_RCVTIMEO expired on a blocking socket.
          return expected<size_t, SocketError>::error(SocketError::kTimeout);
        }
        return expected<size_t, SocketError>::error(r.get_error());
      }
      if (r.value() == 0) break;
      got += static_cast<size_t>(r.value());
    }
    return expected<size_t, SocketError>::success(got);
  }

  expected<void, SocketError> SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    if (enable) {
      flags |= O_NONBLOCK;
    } else {
      flags &= ~O_NONBLOCK;
    }
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Disable Nagle's algorithm so frames are not coalesced. */
  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Bound blocking reads; 0 restores "wait forever". */
  expected<void, SocketError> SetRecvTimeout(uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000U) * 1000U);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv,
                     static_cast<socklen_t>(sizeof(tv))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief shutdown(2) both directions without releasing the fd.
   *
   * Unblocks a thread parked in Recv() on this socket.
   */
  void ShutdownBoth() noexcept {
    if (fd_ >= 0) {
      (void)::shutdown(fd_, SHUT_RDWR);
    }
  }

  /** @brief Close the fd; a second call is a no-op. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }

  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  friend class TcpListener;

  /** @brief Adopt an fd returned by accept4() or socket(). */
  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief Listening socket of the receiver.
 *
 * Accepted connections come back as TcpSocket values with SOCK_CLOEXEC set.
 */
class TcpListener {
 public:
  TcpListener() noexcept : fd_(-1) {}

  ~TcpListener() { Close(); }

  TcpListener(TcpListener&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }

  TcpListener& operator=(TcpListener&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;


  static expected<TcpListener, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
  }


  expected<void, SocketError> SetReuseAddr(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Bind(const SocketAddress& addr) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> Listen(
      int32_t backlog = kDefaultBacklog) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::listen(fd_, backlog) < 0) {
      return expected<void, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief Accept an incoming connection and fill the client address.
   * @param[out] client_addr Filled with the connecting peer's address.
   * @return A connected TcpSocket on success.
   */
  expected<TcpSocket, SocketError> Accept(SocketAddress& client_addr) noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    socklen_t addr_len = client_addr.Size();
    int32_t client_fd =
        ::accept4(fd_, client_addr.RawMut(), &addr_len, SOCK_CLOEXEC);
    if (client_fd < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return expected<TcpSocket, SocketError>::error(
            SocketError::kWouldBlock);
      }
      return expected<TcpSocket, SocketError>::error(
          SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  expected<TcpSocket, SocketError> Accept() noexcept {
    SocketAddress ignored;
    return Accept(ignored);
  }

  /** @brief Port actually bound (useful after binding port 0). */
  uint16_t LocalPort() const noexcept {
    if (fd_ < 0) return 0;
    sockaddr_in addr;
    socklen_t len = static_cast<socklen_t>(sizeof(addr));
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
      return 0;
    }
    return ntohs(addr.sin_port);
  }

  /** @brief Close the listener socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }

  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit TcpListener(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

}  // namespace ferry

#endif  // FERRY_SOCKET_HPP_
