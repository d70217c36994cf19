/**
 * @file test_socket.cpp
 * @brief Tests for socket.hpp: SocketAddress, TcpSocket, TcpListener.
 */

#include <catch2/catch_test_macros.hpp>
#include "ferry/socket.hpp"

#include "test_helpers.hpp"

#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Create
// ============================================================================

TEST_CASE("socket - TcpSocket::Create succeeds", "[socket][tcp]") {
  auto result = ferry::TcpSocket::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
  REQUIRE(result.value().Fd() >= 0);
}

TEST_CASE("socket - TcpListener::Create succeeds", "[socket][tcp]") {
  auto result = ferry::TcpListener::Create();
  REQUIRE(result.has_value());
  REQUIRE(result.value().IsValid());
}

// ============================================================================
// SocketAddress
// ============================================================================

TEST_CASE("socket - SocketAddress::FromIpv4 valid", "[socket][address]") {
  auto result = ferry::SocketAddress::FromIpv4("127.0.0.1", 8080);
  REQUIRE(result.has_value());
  REQUIRE(result.value().Raw() != nullptr);
  REQUIRE(result.value().Size() == sizeof(sockaddr_in));
  REQUIRE(result.value().Port() == 8080);
}

TEST_CASE("socket - SocketAddress::FromIpv4 invalid returns error",
          "[socket][address]") {
  auto result = ferry::SocketAddress::FromIpv4("not.an.ip.address", 80);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ferry::SocketError::kResolveFailed);
}

TEST_CASE("socket - SocketAddress::Resolve handles literals and localhost",
          "[socket][address]") {
  auto lit = ferry::SocketAddress::Resolve("127.0.0.1", 5001);
  REQUIRE(lit.has_value());
  REQUIRE(lit.value().Port() == 5001);

  auto name = ferry::SocketAddress::Resolve("localhost", 5002);
  REQUIRE(name.has_value());
  REQUIRE(name.value().Port() == 5002);

  char buf[32];
  lit.value().Format(buf, sizeof(buf));
  REQUIRE(std::string(buf) == "127.0.0.1:5001");
}

// ============================================================================
// Move semantics
// ============================================================================

TEST_CASE("socket - TcpSocket move semantics", "[socket][tcp]") {
  auto result = ferry::TcpSocket::Create();
  REQUIRE(result.has_value());

  ferry::TcpSocket a = std::move(result.value());
  int original_fd = a.Fd();

  ferry::TcpSocket b(std::move(a));
  REQUIRE(!a.IsValid());
  REQUIRE(b.Fd() == original_fd);

  ferry::TcpSocket c;
  c = std::move(b);
  REQUIRE(!b.IsValid());
  REQUIRE(c.Fd() == original_fd);

  c.Close();
  c.Close();
  REQUIRE(!c.IsValid());
}

// ============================================================================
// Loopback transfer
// ============================================================================

TEST_CASE("socket - listener on port 0 reports its port", "[socket][tcp]") {
  auto lis = ferry::TcpListener::Create();
  REQUIRE(lis.has_value());
  REQUIRE(lis.value().SetReuseAddr(true).has_value());
  auto addr = ferry::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(lis.value().Bind(addr.value()).has_value());
  REQUIRE(lis.value().Listen().has_value());
  REQUIRE(lis.value().LocalPort() != 0);
}

TEST_CASE("socket - SendAll and RecvAll move a large buffer",
          "[socket][tcp]") {
  auto pair = ferry_test::ConnectedPair();
  REQUIRE(pair.first.IsValid());
  REQUIRE(pair.second.IsValid());
  REQUIRE(pair.first.SetNoDelay(true).has_value());

  const std::string data = ferry_test::PatternBytes(3U << 20);
  bool sent = false;
  std::thread writer([&]() {
    sent = pair.first.SendAll(data.data(), data.size()).has_value();
  });
  std::vector<char> got(data.size());
  auto r = pair.second.RecvAll(got.data(), got.size());
  writer.join();
  REQUIRE(sent);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == data.size());
  REQUIRE(std::memcmp(got.data(), data.data(), data.size()) == 0);
}

TEST_CASE("socket - RecvAll returns a short count when the peer closes",
          "[socket][tcp]") {
  auto pair = ferry_test::ConnectedPair();
  const char msg[] = "abc";
  REQUIRE(pair.first.SendAll(msg, 3).has_value());
  pair.first.Close();

  char buf[8];
  auto r = pair.second.RecvAll(buf, sizeof(buf));
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 3U);

  auto eof = pair.second.RecvAll(buf, sizeof(buf));
  REQUIRE(eof.has_value());
  REQUIRE(eof.value() == 0U);
}

TEST_CASE("socket - RecvAll times out with SetRecvTimeout", "[socket][tcp]") {
  auto pair = ferry_test::ConnectedPair();
  REQUIRE(pair.second.SetRecvTimeout(50).has_value());
  char buf[1];
  auto r = pair.second.RecvAll(buf, 1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ferry::SocketError::kTimeout);
}

TEST_CASE("socket - ShutdownBoth unblocks a pending RecvAll", "[socket][tcp]") {
  auto pair = ferry_test::ConnectedPair();
  std::thread t([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pair.second.ShutdownBoth();
  });
  char buf[4];
  auto r = pair.second.RecvAll(buf, sizeof(buf));
  t.join();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
}

TEST_CASE("socket - Connect to a closed port fails", "[socket][tcp]") {
  const uint16_t port = ferry_test::UnusedPort();
  auto addr = ferry::SocketAddress::FromIpv4("127.0.0.1", port);
  auto s = ferry::TcpSocket::Create();
  REQUIRE(s.has_value());
  auto r = s.value().Connect(addr.value(), 500);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ferry::SocketError::kConnectFailed);
}
