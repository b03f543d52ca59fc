/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp over the loopback interface.
 */

#include "ts/socket.hpp"

#include <catch2/catch_test_macros.hpp>

#if TS_HAS_NETWORK

TEST_CASE("SocketAddress FromIpv4", "[socket]") {
  auto ok = ts::SocketAddress::FromIpv4("127.0.0.1", 8554);
  REQUIRE(ok.has_value());
  REQUIRE(ok.value().Port() == 8554);
  REQUIRE(ok.value().AddrBe() == htonl(INADDR_LOOPBACK));

  auto bad = ts::SocketAddress::FromIpv4("192.168.1", 80);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == ts::SocketError::kInvalidAddress);
}

TEST_CASE("TcpSocket ConnectTimeout reaches a listener", "[socket]") {
  auto listener = ts::TcpListener::Create();
  REQUIRE(listener.has_value());
  auto any = ts::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(any.has_value());
  REQUIRE(listener.value().Bind(any.value()).has_value());
  REQUIRE(listener.value().Listen().has_value());
  const uint16_t port = listener.value().LocalPort();
  REQUIRE(port != 0);

  auto sock = ts::TcpSocket::Create();
  REQUIRE(sock.has_value());
  auto target = ts::SocketAddress::FromIpv4("127.0.0.1", port);
  REQUIRE(target.has_value());
  auto r = sock.value().ConnectTimeout(target.value(), 1000);
  REQUIRE(r.has_value());

  auto peer = listener.value().Accept();
  REQUIRE(peer.has_value());
  REQUIRE(peer.value().IsValid());
}

TEST_CASE("TcpSocket ConnectTimeout refused port", "[socket]") {
  // Bind then close to obtain a port nobody listens on.
  uint16_t port = 0;
  {
    auto l = ts::TcpListener::Create();
    REQUIRE(l.has_value());
    auto any = ts::SocketAddress::FromIpv4("127.0.0.1", 0);
    REQUIRE(l.value().Bind(any.value()).has_value());
    port = l.value().LocalPort();
  }
  auto sock = ts::TcpSocket::Create();
  REQUIRE(sock.has_value());
  auto target = ts::SocketAddress::FromIpv4("127.0.0.1", port);
  auto r = sock.value().ConnectTimeout(target.value(), 500);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ts::SocketError::kConnectFailed);
}

TEST_CASE("TcpSocket move transfers ownership", "[socket]") {
  auto sock = ts::TcpSocket::Create();
  REQUIRE(sock.has_value());
  const int32_t fd = sock.value().Fd();
  ts::TcpSocket moved(std::move(sock.value()));
  REQUIRE(moved.Fd() == fd);
  REQUIRE_FALSE(sock.value().IsValid());
}

TEST_CASE("IcmpSocket echo to loopback when permitted", "[socket][icmp]") {
  auto icmp = ts::IcmpSocket::Create();
  if (!icmp.has_value()) {
    REQUIRE(icmp.get_error() == ts::SocketError::kUnsupported);
    SKIP("ICMP sockets not permitted for this user");
  }
  auto lo = ts::SocketAddress::FromIpv4("127.0.0.1", 0);
  auto r = icmp.value().Echo(lo.value(), 1000);
  REQUIRE(r.has_value());
}

#endif  // TS_HAS_NETWORK
