/**
 * @file test_io_poller.cpp
 * @brief Tests for io_poller.hpp: IoPoller, PollResult, IoEvent.
 */

#include <catch2/catch_test_macros.hpp>
#include "ferry/io_poller.hpp"

#include <unistd.h>

TEST_CASE("io_poller - default construction is valid", "[io_poller]") {
  ferry::IoPoller poller;
  REQUIRE(poller.IsValid());
  REQUIRE(poller.Fd() >= 0);
}

TEST_CASE("io_poller - Add and Remove fd", "[io_poller]") {
  ferry::IoPoller poller;
  int pipefd[2];
  REQUIRE(::pipe(pipefd) == 0);

  REQUIRE(poller.Add(pipefd[0], static_cast<uint8_t>(ferry::IoEvent::kReadable))
              .has_value());
  REQUIRE(poller.Remove(pipefd[0]).has_value());

  ::close(pipefd[0]);
  ::close(pipefd[1]);
}

TEST_CASE("io_poller - Add invalid fd fails", "[io_poller]") {
  ferry::IoPoller poller;
  auto r = poller.Add(-1, static_cast<uint8_t>(ferry::IoEvent::kReadable));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ferry::PollerError::kAddFailed);
}

TEST_CASE("io_poller - Wait times out with no events", "[io_poller]") {
  ferry::IoPoller poller;
  int pipefd[2];
  REQUIRE(::pipe(pipefd) == 0);
  REQUIRE(poller.Add(pipefd[0], static_cast<uint8_t>(ferry::IoEvent::kReadable))
              .has_value());

  auto r = poller.Wait(20);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);

  ::close(pipefd[0]);
  ::close(pipefd[1]);
}

TEST_CASE("io_poller - readable pipe is reported", "[io_poller]") {
  ferry::IoPoller poller;
  int pipefd[2];
  REQUIRE(::pipe(pipefd) == 0);
  REQUIRE(poller.Add(pipefd[0], static_cast<uint8_t>(ferry::IoEvent::kReadable))
              .has_value());

  const char byte = 'x';
  REQUIRE(::write(pipefd[1], &byte, 1) == 1);

  auto r = poller.Wait(1000);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(poller.ResultCount() == 1U);
  REQUIRE(poller.Results()[0].fd == pipefd[0]);
  REQUIRE((poller.Results()[0].events &
           static_cast<uint8_t>(ferry::IoEvent::kReadable)) != 0U);

  ::close(pipefd[0]);
  ::close(pipefd[1]);
}
