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
 * @file net.hpp
 * @brief sockpp-based reachability probe.
 *
 * Only available when TS_HAS_SOCKPP is defined (CMake finds sockpp). Gives
 * the scanner a TCP probe built on sockpp's tcp_connector as an alternative
 * to the POSIX TcpConnectProbe; selected with [scan] tcp_backend = sockpp.
 */

#ifndef TS_NET_HPP_
#define TS_NET_HPP_

#include "ts/platform.hpp"

#if TS_HAS_NETWORK

#ifdef TS_HAS_SOCKPP

#include "ts/log.hpp"
#include "ts/subnet_scanner.hpp"
#include "ts/vocabulary.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/tcp_connector.h>

#include <chrono>
#include <string>

namespace ts {
namespace net {

// ============================================================================
// NetError
// ============================================================================

enum class NetError : uint8_t {
  kInvalidAddress = 0,
  kConnectFailed,
};

/**
 * @brief Open and immediately close a TCP connection.
 * @param timeout_ms Upper bound for the handshake (0 = blocking connect).
 */
inline expected<void, NetError> TcpProbe(const char* host, uint16_t port,
                                         uint32_t timeout_ms) noexcept {
  auto addr_res = sockpp::inet_address::create(host, port);
  if (!addr_res) {
    return expected<void, NetError>::error(NetError::kInvalidAddress);
  }

  sockpp::tcp_connector conn;
  sockpp::result<> res;
  if (timeout_ms > 0U) {
    res = conn.connect(addr_res.value(),
                       std::chrono::milliseconds(timeout_ms));
  } else {
    res = conn.connect(addr_res.value());
  }
  if (!res) {
    return expected<void, NetError>::error(NetError::kConnectFailed);
  }
  (void)conn.close();
  return expected<void, NetError>::success();
}

// ============================================================================
// SockppConnectProbe
// ============================================================================

/// @brief HostProber over sockpp, with optional ICMP fallback.
class SockppConnectProbe final : public HostProber {
 public:
  explicit SockppConnectProbe(const ScanOptions& opts = ScanOptions()) noexcept
      : port_(opts.probe_port),
        timeout_ms_(opts.timeout_ms),
        icmp_(opts.timeout_ms),
        icmp_fallback_(opts.icmp_fallback) {}

  bool IsReachable(const std::string& address) override {
    if (TcpProbe(address.c_str(), port_, timeout_ms_).has_value()) {
      return true;
    }
    return icmp_fallback_ && icmp_.IsReachable(address);
  }

 private:
  uint16_t port_;
  uint32_t timeout_ms_;
  IcmpEchoProbe icmp_;
  bool icmp_fallback_;
};

}  // namespace net
}  // namespace ts

#endif  // TS_HAS_SOCKPP

#endif  // TS_HAS_NETWORK

#endif  // TS_NET_HPP_
