/**
 * @file test_net.cpp
 * @brief Tests for net.hpp (sockpp probe backend).
 */

#include "ts/net.hpp"

#include <catch2/catch_test_macros.hpp>

#if TS_HAS_NETWORK && defined(TS_HAS_SOCKPP)

#include "ts/socket.hpp"

namespace {

uint16_t ListenOnLoopback(ts::TcpListener& listener) {
  auto l = ts::TcpListener::Create();
  REQUIRE(l.has_value());
  listener = std::move(l.value());
  auto any = ts::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(listener.Bind(any.value()).has_value());
  REQUIRE(listener.Listen().has_value());
  return listener.LocalPort();
}

}  // namespace

TEST_CASE("net TcpProbe connects to a listener", "[net]") {
  ts::TcpListener listener;
  const uint16_t port = ListenOnLoopback(listener);
  REQUIRE(ts::net::TcpProbe("127.0.0.1", port, 1000).has_value());
}

TEST_CASE("net TcpProbe refused port", "[net]") {
  uint16_t port = 0;
  {
    ts::TcpListener listener;
    port = ListenOnLoopback(listener);
  }
  auto r = ts::net::TcpProbe("127.0.0.1", port, 500);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ts::net::NetError::kConnectFailed);
}

TEST_CASE("net SockppConnectProbe uses the configured port", "[net]") {
  ts::TcpListener listener;
  ts::ScanOptions opts;
  opts.probe_port = ListenOnLoopback(listener);
  opts.timeout_ms = 500;
  opts.icmp_fallback = false;
  ts::net::SockppConnectProbe probe(opts);
  REQUIRE(probe.IsReachable("127.0.0.1"));
  REQUIRE_FALSE(probe.IsReachable("not-an-address"));
}

#endif  // TS_HAS_NETWORK && TS_HAS_SOCKPP
