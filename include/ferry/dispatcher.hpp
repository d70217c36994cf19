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
 * @file dispatcher.hpp
 * @brief FanoutDispatcher - delivers each file to every destination.
 *
 * Architecture:
 *   Deliver(path, name) / Dispatch(path, name)
 *        | enqueue one job per destination
 *   Lane[0..N-1] FIFO -> LaneThread -> SenderConnection::Send() -> log
 *        | std::promise
 *   Dispatch() collects one DeliveryReport per destination
 *
 * Lanes share nothing. A lane stuck in its reconnect loop only delays its
 * own queue. Deliver() never waits; Dispatch() stops waiting after
 * result_timeout_ms and reports kPending while the lane keeps delivering
 * in the background.
 *
 * Usage:
 *   ferry::DispatcherOptions opts;
 *   ferry::FanoutDispatcher fan({{"10.0.0.2", 5001}, {"10.0.0.3", 5001}}, opts);
 *   fan.Start();
 *   auto reports = fan.Dispatch("/origen/a.txt", "a.txt");
 *   fan.Stop();
 */

#ifndef FERRY_DISPATCHER_HPP_
#define FERRY_DISPATCHER_HPP_

#include "ferry/log.hpp"
#include "ferry/sender.hpp"
#include "ferry/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ferry {

// ============================================================================
// FileSink
// ============================================================================

/** @brief Consumer of stable files found by the watch loop. */
class FileSink {
 public:
  virtual ~FileSink() = default;
  virtual void Deliver(const std::string& path, const std::string& name) = 0;
};

// ============================================================================
// DeliveryReport
// ============================================================================

enum class DeliveryStatus : uint8_t {
  kDelivered = 0,
  kFailed,     ///< Send() returned an error; see DeliveryReport::error.
  kPending,    ///< Still in flight when the result wait expired.
  kQueueFull,  ///< Lane backlog at max_pending; event dropped for this lane.
  kStopped
};

inline const char* DeliveryStatusName(DeliveryStatus s) noexcept {
  switch (s) {
    case DeliveryStatus::kDelivered: return "delivered";
    case DeliveryStatus::kFailed:    return "failed";
    case DeliveryStatus::kPending:   return "pending";
    case DeliveryStatus::kQueueFull: return "queue full";
    case DeliveryStatus::kStopped:   return "stopped";
    default:                         return "unknown";
  }
}

struct DeliveryReport {
  Destination destination;
  DeliveryStatus status = DeliveryStatus::kPending;
  /// Meaningful only when status == kFailed.
  SendError error = SendError::kConnection;
};

struct DispatcherOptions {
  SenderOptions sender;
  /// 0 waits for every destination without limit.
  uint32_t result_timeout_ms = 10000;
  size_t max_pending = 1024;
};

// ============================================================================
// FanoutDispatcher
// ============================================================================

class FanoutDispatcher : public FileSink {
 public:
  FanoutDispatcher(const std::vector<Destination>& dests,
                   DispatcherOptions opts)
      : opts_(opts) {
    lanes_.reserve(dests.size());
    for (const auto& d : dests) {
      auto lane = std::make_unique<Lane>();
      lane->conn = std::make_unique<SenderConnection>(d, opts_.sender);
      lanes_.push_back(std::move(lane));
    }
  }

  ~FanoutDispatcher() override { Stop(); }

  FanoutDispatcher(const FanoutDispatcher&) = delete;
  FanoutDispatcher& operator=(const FanoutDispatcher&) = delete;

  /** @brief Spawn one lane thread per destination; each connects eagerly. */
  void Start() {
    if (running_) return;
    running_ = true;
    for (auto& lane : lanes_) {
      lane->thread = std::thread(&FanoutDispatcher::LaneMain, this, lane.get());
    }
    FERRY_LOG_INFO("Fanout", "Started %zu lane(s)", lanes_.size());
  }

  /** @brief Stop all lanes; queued jobs complete with kStopped. */
  void Stop() {
    if (!running_) return;
    running_ = false;
    for (auto& lane : lanes_) {
      {
        std::lock_guard<std::mutex> lock(lane->mutex);
        lane->stopping = true;
      }
      lane->cv.notify_all();
      lane->conn->Stop();
    }
    for (auto& lane : lanes_) {
      if (lane->thread.joinable()) lane->thread.join();
    }
    FERRY_LOG_INFO("Fanout", "Stopped");
  }

  /**
   * @brief Deliver one file to every destination and wait for the results.
   *
   * Waits at most result_timeout_ms in total; lanes still busy after that
   * are reported as kPending and finish in the background.
   * @return One report per destination, in construction order.
   */
  std::vector<DeliveryReport> Dispatch(const std::string& path,
                                       const std::string& name) {
    std::vector<DeliveryReport> reports(lanes_.size());
    std::vector<std::future<expected<void, SendError>>> futures(lanes_.size());
    for (size_t i = 0; i < lanes_.size(); ++i) {
      reports[i].destination = lanes_[i]->conn->Dest();
      reports[i].status = Enqueue(*lanes_[i], path, name, &futures[i]);
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(opts_.result_timeout_ms);
    for (size_t i = 0; i < lanes_.size(); ++i) {
      if (!futures[i].valid()) continue;
      if (opts_.result_timeout_ms > 0U &&
          futures[i].wait_until(deadline) != std::future_status::ready) {
        reports[i].status = DeliveryStatus::kPending;
        FERRY_LOG_WARN("Fanout", "%s to %s still pending, continuing in "
                       "background", name.c_str(),
                       reports[i].destination.ToString().c_str());
        continue;
      }
      auto r = futures[i].get();
      if (r.has_value()) {
        reports[i].status = DeliveryStatus::kDelivered;
      } else if (r.get_error() == SendError::kStopped) {
        reports[i].status = DeliveryStatus::kStopped;
      } else {
        reports[i].status = DeliveryStatus::kFailed;
        reports[i].error = r.get_error();
      }
    }
    return reports;
  }

  /**
   * @brief Queue one file for every destination and return at once.
   *
   * Called from the watch loop. An unreachable destination only grows its
   * own lane backlog; each lane logs its own outcome.
   */
  void Deliver(const std::string& path, const std::string& name) override {
    for (auto& lane : lanes_) {
      (void)Enqueue(*lane, path, name, nullptr);
    }
  }

  /** @brief Jobs waiting in all lanes, not counting the one in flight. */
  size_t Backlog() const {
    size_t n = 0;
    for (const auto& lane : lanes_) {
      std::lock_guard<std::mutex> lock(lane->mutex);
      n += lane->queue.size();
    }
    return n;
  }

  size_t DestinationCount() const noexcept { return lanes_.size(); }
  bool IsRunning() const noexcept { return running_; }

 private:
  struct Job {
    std::string path;
    std::string name;
    std::promise<expected<void, SendError>> done;
  };

  struct Lane {
    std::unique_ptr<SenderConnection> conn;
    std::thread thread;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::unique_ptr<Job>> queue;
    bool stopping = false;
  };

  /**
   * @brief Append a job to @p lane.
   * @param result Receives the job's future; nullptr when nobody waits.
   * @return kPending when queued, otherwise kStopped or kQueueFull.
   */
  DeliveryStatus Enqueue(Lane& lane, const std::string& path,
                         const std::string& name,
                         std::future<expected<void, SendError>>* result) {
    DeliveryStatus status = DeliveryStatus::kPending;
    {
      std::lock_guard<std::mutex> lock(lane.mutex);
      if (!running_ || lane.stopping) {
        status = DeliveryStatus::kStopped;
      } else if (lane.queue.size() >= opts_.max_pending) {
        status = DeliveryStatus::kQueueFull;
      } else {
        auto job = std::make_unique<Job>();
        job->path = path;
        job->name = name;
        if (result != nullptr) *result = job->done.get_future();
        lane.queue.push_back(std::move(job));
      }
    }
    if (status == DeliveryStatus::kPending) {
      lane.cv.notify_one();
    } else {
      FERRY_LOG_ERROR("Fanout", "Dropped %s for %s: %s", name.c_str(),
                      lane.conn->Dest().ToString().c_str(),
                      DeliveryStatusName(status));
    }
    return status;
  }

  static void LogOutcome(const Lane& lane, const Job& job,
                         const expected<void, SendError>& r) {
    const std::string dst = lane.conn->Dest().ToString();
    if (r.has_value()) {
      FERRY_LOG_INFO("Fanout", "Sent %s to %s", job.name.c_str(), dst.c_str());
    } else if (r.get_error() != SendError::kStopped) {
      FERRY_LOG_ERROR("Fanout", "Failed to send %s to %s: %s",
                      job.name.c_str(), dst.c_str(),
                      SendErrorName(r.get_error()));
    }
  }

  void LaneMain(Lane* lane) {
    (void)lane->conn->Connect();
    for (;;) {
      std::unique_ptr<Job> job;
      {
        std::unique_lock<std::mutex> lock(lane->mutex);
        lane->cv.wait(lock,
                      [lane]() { return lane->stopping || !lane->queue.empty(); });
        if (lane->stopping) break;
        job = std::move(lane->queue.front());
        lane->queue.pop_front();
      }
      auto r = lane->conn->Send(job->path, job->name);
      LogOutcome(*lane, *job, r);
      job->done.set_value(std::move(r));
    }

    std::lock_guard<std::mutex> lock(lane->mutex);
    for (auto& job : lane->queue) {
      job->done.set_value(expected<void, SendError>::error(SendError::kStopped));
    }
    lane->queue.clear();
  }

  DispatcherOptions opts_;
  std::vector<std::unique_ptr<Lane>> lanes_;
  std::atomic<bool> running_{false};
};

}  // namespace ferry

#endif  // FERRY_DISPATCHER_HPP_
