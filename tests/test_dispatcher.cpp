/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp: FanoutDispatcher delivery reports.
 */

#include <catch2/catch_test_macros.hpp>
#include "ferry/dispatcher.hpp"
#include "ferry/receiver.hpp"

#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

struct LiveReceiver {
  explicit LiveReceiver(const char* tag) : dir(tag) {
    ferry::ReceiverOptions o;
    o.dest_dir = dir.Str();
    rx.reset(new ferry::Receiver(o));
    (void)rx->Start("127.0.0.1", 0);
  }
  ferry::Destination Dest() const { return {"127.0.0.1", rx->Port()}; }

  ferry_test::TempDir dir;
  std::unique_ptr<ferry::Receiver> rx;
};

ferry::DispatcherOptions FastOptions(uint32_t result_timeout_ms) {
  ferry::DispatcherOptions o;
  o.sender.backoff_ms = 50;
  o.sender.connect_timeout_ms = 500;
  o.result_timeout_ms = result_timeout_ms;
  return o;
}

}  // namespace

TEST_CASE("dispatcher - file reaches every destination", "[dispatcher]") {
  ferry_test::TempDir src("fan_src");
  LiveReceiver a("fan_a");
  LiveReceiver b("fan_b");
  ferry_test::WriteFile(src.Path() / "d/f.txt", "fanned out");

  ferry::FanoutDispatcher fan({a.Dest(), b.Dest()}, FastOptions(5000));
  REQUIRE(fan.DestinationCount() == 2U);
  fan.Start();
  auto reports = fan.Dispatch((src.Path() / "d/f.txt").string(), "d/f.txt");
  fan.Stop();

  REQUIRE(reports.size() == 2U);
  REQUIRE(reports[0].destination.port == a.rx->Port());
  REQUIRE(reports[1].destination.port == b.rx->Port());
  for (const auto& r : reports) {
    REQUIRE(r.status == ferry::DeliveryStatus::kDelivered);
  }
  REQUIRE(ferry_test::ReadFile(a.dir.Path() / "d/f.txt") == "fanned out");
  REQUIRE(ferry_test::ReadFile(b.dir.Path() / "d/f.txt") == "fanned out");
}

TEST_CASE("dispatcher - unreachable destination does not block the others",
          "[dispatcher][independence]") {
  ferry_test::TempDir src("fan_src");
  LiveReceiver up("fan_up");
  const ferry::Destination down{"127.0.0.1", ferry_test::UnusedPort()};
  ferry_test::WriteFile(src.Path() / "f", "reachable only");

  ferry::FanoutDispatcher fan({down, up.Dest()}, FastOptions(500));
  fan.Start();
  const auto t0 = std::chrono::steady_clock::now();
  auto reports = fan.Dispatch((src.Path() / "f").string(), "f");
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  fan.Stop();

  REQUIRE(reports.size() == 2U);
  REQUIRE(reports[0].status == ferry::DeliveryStatus::kPending);
  REQUIRE(reports[1].status == ferry::DeliveryStatus::kDelivered);
  REQUIRE(elapsed < std::chrono::seconds(3));
  REQUIRE(ferry_test::ReadFile(up.dir.Path() / "f") == "reachable only");
}

TEST_CASE("dispatcher - pending delivery completes once the receiver appears",
          "[dispatcher][independence]") {
  ferry_test::TempDir src("fan_src");
  ferry_test::TempDir dst("fan_late");
  const uint16_t port = ferry_test::UnusedPort();
  ferry_test::WriteFile(src.Path() / "late.txt", "eventually");

  ferry::FanoutDispatcher fan({{"127.0.0.1", port}}, FastOptions(200));
  fan.Start();
  auto reports = fan.Dispatch((src.Path() / "late.txt").string(), "late.txt");
  REQUIRE(reports[0].status == ferry::DeliveryStatus::kPending);

  ferry::ReceiverOptions ro;
  ro.dest_dir = dst.Str();
  ferry::Receiver rx(ro);
  REQUIRE(rx.Start("127.0.0.1", port).has_value());
  REQUIRE(ferry_test::WaitFor(
      [&]() { return fs::exists(dst.Path() / "late.txt"); }));
  REQUIRE(ferry_test::ReadFile(dst.Path() / "late.txt") == "eventually");
  fan.Stop();
  rx.Stop();
}

TEST_CASE("dispatcher - per-file failure is reported, not fatal",
          "[dispatcher]") {
  LiveReceiver a("fan_a");
  ferry::FanoutDispatcher fan({a.Dest()}, FastOptions(5000));
  fan.Start();
  auto missing = fan.Dispatch("/nonexistent/ferry/file", "file");
  REQUIRE(missing[0].status == ferry::DeliveryStatus::kFailed);
  REQUIRE(missing[0].error == ferry::SendError::kFileError);

  ferry_test::TempDir src("fan_src");
  ferry_test::WriteFile(src.Path() / "ok", "still works");
  auto ok = fan.Dispatch((src.Path() / "ok").string(), "ok");
  REQUIRE(ok[0].status == ferry::DeliveryStatus::kDelivered);
  fan.Stop();
}

TEST_CASE("dispatcher - full lane queue reports kQueueFull",
          "[dispatcher][queue]") {
  ferry::DispatcherOptions o = FastOptions(50);
  o.max_pending = 1;
  ferry::FanoutDispatcher fan({{"127.0.0.1", ferry_test::UnusedPort()}}, o);
  fan.Start();
  // The lane is parked in its reconnect loop, so nothing drains the queue.
  auto first = fan.Dispatch("/tmp/a", "a");
  auto second = fan.Dispatch("/tmp/b", "b");
  REQUIRE(first[0].status == ferry::DeliveryStatus::kPending);
  REQUIRE(second[0].status == ferry::DeliveryStatus::kQueueFull);
  fan.Stop();
}

TEST_CASE("dispatcher - stopped dispatcher reports kStopped",
          "[dispatcher][lifecycle]") {
  ferry::FanoutDispatcher fan({{"127.0.0.1", ferry_test::UnusedPort()}},
                              FastOptions(50));
  auto before = fan.Dispatch("/tmp/a", "a");
  REQUIRE(before[0].status == ferry::DeliveryStatus::kStopped);

  fan.Start();
  REQUIRE(fan.IsRunning());
  fan.Stop();
  REQUIRE(!fan.IsRunning());
  auto after = fan.Dispatch("/tmp/a", "a");
  REQUIRE(after[0].status == ferry::DeliveryStatus::kStopped);
}

TEST_CASE("dispatcher - Deliver through the FileSink interface",
          "[dispatcher][sink]") {
  ferry_test::TempDir src("fan_src");
  LiveReceiver a("fan_a");
  ferry_test::WriteFile(src.Path() / "s.txt", "via sink");
  ferry::FanoutDispatcher fan({a.Dest()}, FastOptions(5000));
  fan.Start();
  ferry::FileSink& sink = fan;
  sink.Deliver((src.Path() / "s.txt").string(), "s.txt");
  REQUIRE(ferry_test::WaitFor(
      [&]() { return fs::exists(a.dir.Path() / "s.txt"); }));
  fan.Stop();
  REQUIRE(ferry_test::ReadFile(a.dir.Path() / "s.txt") == "via sink");
}

TEST_CASE("dispatcher - Deliver never waits on a down destination",
          "[dispatcher][sink][independence]") {
  ferry_test::TempDir src("fan_src");
  LiveReceiver up("fan_up");
  const ferry::Destination down{"127.0.0.1", ferry_test::UnusedPort()};

  // Production defaults: a blocking Deliver would stall 10 s per file here.
  ferry::DispatcherOptions opts;
  REQUIRE(opts.result_timeout_ms == 10000U);
  ferry::FanoutDispatcher fan({down, up.Dest()}, opts);
  fan.Start();

  for (int i = 0; i < 3; ++i) {
    const std::string name = "e" + std::to_string(i);
    ferry_test::WriteFile(src.Path() / name, "event " + std::to_string(i));
    const auto t0 = std::chrono::steady_clock::now();
    fan.Deliver((src.Path() / name).string(), name);
    REQUIRE(std::chrono::steady_clock::now() - t0 <
            std::chrono::milliseconds(500));
    REQUIRE(ferry_test::WaitFor(
        [&]() { return fs::exists(up.dir.Path() / name); }, 3000U));
  }
  for (int i = 0; i < 3; ++i) {
    const std::string name = "e" + std::to_string(i);
    REQUIRE(ferry_test::ReadFile(up.dir.Path() / name) ==
            "event " + std::to_string(i));
  }
  // The down lane still holds its copies.
  REQUIRE(fan.Backlog() >= 2U);
  fan.Stop();
  REQUIRE(fan.Backlog() == 0U);
}
