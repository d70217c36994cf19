/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp: expected, ScopeGuard, FERRY_SCOPE_EXIT.
 */

#include "ferry/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

TEST_CASE("expected - success holds value", "[vocabulary][expected]") {
  auto r = ferry::expected<int, ferry::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
  REQUIRE(r.value_or(7) == 42);
}

TEST_CASE("expected - error holds code", "[vocabulary][expected]") {
  auto r = ferry::expected<int, ferry::ConfigError>::error(
      ferry::ConfigError::kParseError);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == ferry::ConfigError::kParseError);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected - non-trivial value survives copy and move",
          "[vocabulary][expected]") {
  using E = ferry::expected<std::string, ferry::ConfigError>;
  E a = E::success(std::string("payload"));
  E b = a;
  REQUIRE(b.value() == "payload");
  E c = std::move(a);
  REQUIRE(c.value() == "payload");

  E d = E::error(ferry::ConfigError::kMissingValue);
  d = c;
  REQUIRE(d.has_value());
  REQUIRE(d.value() == "payload");

  d = E::error(ferry::ConfigError::kInvalidValue);
  REQUIRE(!d.has_value());
  REQUIRE(d.get_error() == ferry::ConfigError::kInvalidValue);
}

TEST_CASE("expected<void> - success and error", "[vocabulary][expected]") {
  auto ok = ferry::expected<void, ferry::ConfigError>::success();
  REQUIRE(ok.has_value());
  auto bad = ferry::expected<void, ferry::ConfigError>::error(
      ferry::ConfigError::kFileNotFound);
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == ferry::ConfigError::kFileNotFound);
}

TEST_CASE("ScopeGuard - runs on scope exit", "[vocabulary][scope_guard]") {
  int hits = 0;
  {
    ferry::ScopeGuard g([&hits]() { ++hits; });
    REQUIRE(hits == 0);
  }
  REQUIRE(hits == 1);
}

TEST_CASE("ScopeGuard - release cancels cleanup", "[vocabulary][scope_guard]") {
  int hits = 0;
  {
    ferry::ScopeGuard g([&hits]() { ++hits; });
    g.release();
  }
  REQUIRE(hits == 0);
}

TEST_CASE("ScopeGuard - moved-from guard does not fire twice",
          "[vocabulary][scope_guard]") {
  int hits = 0;
  {
    ferry::ScopeGuard a([&hits]() { ++hits; });
    ferry::ScopeGuard b(std::move(a));
  }
  REQUIRE(hits == 1);
}

TEST_CASE("FERRY_SCOPE_EXIT - two guards in one scope run LIFO",
          "[vocabulary][scope_guard]") {
  std::string order;
  {
    FERRY_SCOPE_EXIT(order += "a");
    FERRY_SCOPE_EXIT(order += "b");
  }
  REQUIRE(order == "ba");
}
