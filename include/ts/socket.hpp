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
 * @brief POSIX socket RAII wrappers used by the reachability probes.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Provides SocketAddress, TcpSocket (with bounded connect), TcpListener and
 * IcmpSocket (echo request / reply). All errors are returned via
 * ts::expected<V,E>.
 */

#ifndef TS_SOCKET_HPP_
#define TS_SOCKET_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#if TS_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace ts {

// ============================================================================
// Constants
// ============================================================================

constexpr int32_t kDefaultBacklog = 16;

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
  kUnsupported  ///< Kernel refused the socket type (e.g. ping sockets off).
};

namespace detail {

inline uint64_t SteadyNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief poll(2) a single fd, retrying on EINTR until the deadline.
/// @return >0 ready, 0 timeout, <0 error.
inline int PollUntil(int fd, short events, uint64_t deadline_ms) noexcept {
  for (;;) {
    const uint64_t now = SteadyNowMs();
    if (now >= deadline_ms) {
      return 0;
    }
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, static_cast<int>(deadline_ms - now));
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    return rc;
  }
}

inline bool SetFdNonBlocking(int fd, bool enable) noexcept {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address (sockaddr_in wrapper).
 */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @brief Create an IPv4 socket address from a dotted-decimal string.
   * @return kInvalidAddress when @p ip is not a valid IPv4 literal.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  /// @brief IPv4 address in network byte order.
  uint32_t AddrBe() const noexcept { return addr_.sin_addr.s_addr; }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket. Movable, not copyable.
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

  /**
   * @brief Connect with an upper bound on the time spent.
   *
   * The socket is switched to non-blocking for the handshake and restored
   * afterwards. A refused connection is reported as kConnectFailed, an
   * unanswered one as kTimeout.
   */
  expected<void, SocketError> ConnectTimeout(const SocketAddress& addr,
                                             uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (!detail::SetFdNonBlocking(fd_, true)) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }

    int rc = ::connect(fd_, addr.Raw(), addr.Size());
    if (rc < 0 && errno != EINPROGRESS) {
      return expected<void, SocketError>::error(SocketError::kConnectFailed);
    }
    if (rc < 0) {
      const uint64_t deadline = detail::SteadyNowMs() + timeout_ms;
      int ready = detail::PollUntil(fd_, POLLOUT, deadline);
      if (ready == 0) {
        return expected<void, SocketError>::error(SocketError::kTimeout);
      }
      if (ready < 0) {
        return expected<void, SocketError>::error(SocketError::kConnectFailed);
      }
      int so_error = 0;
      socklen_t len = static_cast<socklen_t>(sizeof(so_error));
      if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
          so_error != 0) {
        return expected<void, SocketError>::error(SocketError::kConnectFailed);
      }
    }

    (void)detail::SetFdNonBlocking(fd_, false);
    return expected<void, SocketError>::success();
  }

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

  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief RAII TCP listener. Used by tests to stand in for a camera's
 *        SSH port.
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
    int32_t opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      ::close(fd);
      return expected<TcpListener, SocketError>::error(
          SocketError::kSetOptFailed);
    }
    return expected<TcpListener, SocketError>::success(TcpListener(fd));
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

  expected<TcpSocket, SocketError> Accept() noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t client_fd = ::accept(fd_, nullptr, nullptr);
    if (client_fd < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client_fd));
  }

  /// @brief Port actually bound (useful after binding port 0).
  uint16_t LocalPort() const noexcept {
    SocketAddress local;
    socklen_t len = local.Size();
    if (fd_ < 0 || ::getsockname(fd_, local.RawMut(), &len) != 0) {
      return 0;
    }
    return local.Port();
  }

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

// ============================================================================
// IcmpSocket
// ============================================================================

/**
 * @brief ICMP echo socket.
 *
 * Prefers the unprivileged datagram ping socket (Linux
 * net.ipv4.ping_group_range); falls back to a raw socket, which needs
 * CAP_NET_RAW. When neither is permitted Create() returns kUnsupported.
 */
class IcmpSocket {
 public:
  IcmpSocket() noexcept : fd_(-1), raw_(false), sequence_(0) {}
  ~IcmpSocket() { Close(); }

  IcmpSocket(IcmpSocket&& other) noexcept
      : fd_(other.fd_), raw_(other.raw_), sequence_(other.sequence_) {
    other.fd_ = -1;
  }

  IcmpSocket& operator=(IcmpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      raw_ = other.raw_;
      sequence_ = other.sequence_;
      other.fd_ = -1;
    }
    return *this;
  }

  IcmpSocket(const IcmpSocket&) = delete;
  IcmpSocket& operator=(const IcmpSocket&) = delete;

  static expected<IcmpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
    bool raw = false;
    if (fd < 0) {
      fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
      raw = true;
    }
    if (fd < 0) {
      return expected<IcmpSocket, SocketError>::error(
          (errno == EACCES || errno == EPERM) ? SocketError::kUnsupported
                                              : SocketError::kInvalidFd);
    }
    IcmpSocket s;
    s.fd_ = fd;
    s.raw_ = raw;
    return expected<IcmpSocket, SocketError>::success(std::move(s));
  }

  /**
   * @brief Send one echo request and wait for the matching reply.
   * @return success when an echo reply from @p addr arrives before the
   *         deadline, kTimeout otherwise.
   */
  expected<void, SocketError> Echo(const SocketAddress& addr,
                                   uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }

    uint8_t packet[sizeof(struct icmphdr) + 16];
    std::memset(packet, 0, sizeof(packet));
    auto* hdr = reinterpret_cast<struct icmphdr*>(packet);
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = htons(static_cast<uint16_t>(::getpid() & 0xFFFF));
    hdr->un.echo.sequence = htons(++sequence_);
    std::memcpy(packet + sizeof(struct icmphdr), "tetherstream-png", 16);
    hdr->checksum = Checksum(packet, sizeof(packet));

    if (::sendto(fd_, packet, sizeof(packet), 0, addr.Raw(), addr.Size()) <
        0) {
      return expected<void, SocketError>::error(SocketError::kSendFailed);
    }

    const uint64_t deadline = detail::SteadyNowMs() + timeout_ms;
    uint8_t reply[512];
    for (;;) {
      int ready = detail::PollUntil(fd_, POLLIN, deadline);
      if (ready == 0) {
        return expected<void, SocketError>::error(SocketError::kTimeout);
      }
      if (ready < 0) {
        return expected<void, SocketError>::error(SocketError::kRecvFailed);
      }
      SocketAddress from;
      socklen_t from_len = from.Size();
      ssize_t n = ::recvfrom(fd_, reply, sizeof(reply), 0, from.RawMut(),
                             &from_len);
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        return expected<void, SocketError>::error(SocketError::kRecvFailed);
      }
      if (from.AddrBe() != addr.AddrBe()) {
        continue;
      }
      size_t offset = 0;
      if (raw_) {
        if (static_cast<size_t>(n) < sizeof(struct iphdr)) {
          continue;
        }
        offset = static_cast<size_t>(
                     reinterpret_cast<const struct iphdr*>(reply)->ihl) * 4U;
      }
      if (static_cast<size_t>(n) < offset + sizeof(struct icmphdr)) {
        continue;
      }
      const auto* rh = reinterpret_cast<const struct icmphdr*>(reply + offset);
      if (rh->type == ICMP_ECHOREPLY) {
        return expected<void, SocketError>::success();
      }
    }
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool IsValid() const noexcept { return fd_ >= 0; }
  bool IsRaw() const noexcept { return raw_; }

 private:
  static uint16_t Checksum(const uint8_t* data, size_t len) noexcept {
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < len; i += 2) {
      sum += static_cast<uint32_t>((data[i] << 8) | data[i + 1]);
    }
    if ((len & 1U) != 0U) {
      sum += static_cast<uint32_t>(data[len - 1] << 8);
    }
    while ((sum >> 16) != 0U) {
      sum = (sum & 0xFFFFU) + (sum >> 16);
    }
    return htons(static_cast<uint16_t>(~sum & 0xFFFFU));
  }

  int32_t fd_;
  bool raw_;
  uint16_t sequence_;
};

}  // namespace ts

#endif  // TS_HAS_NETWORK

#endif  // TS_SOCKET_HPP_
