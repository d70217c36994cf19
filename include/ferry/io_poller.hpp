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
 * @file io_poller.hpp
 * @brief Level-triggered epoll wrapper.
 *
 * Used to wait on the listening socket and the inotify descriptor with a
 * timeout, so accept and watch loops can notice a stop request.
 */

#ifndef FERRY_IO_POLLER_HPP_
#define FERRY_IO_POLLER_HPP_

#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <cstdint>

#include <sys/epoll.h>
#include <unistd.h>

namespace ferry {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kRemoveFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

#ifndef FERRY_IO_POLLER_MAX_EVENTS
#define FERRY_IO_POLLER_MAX_EVENTS 16U
#endif

class IoPoller {
 public:
  IoPoller() noexcept
      : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)), results_{}, count_(0) {}

  ~IoPoller() {
    if (poller_fd_ >= 0) {
      ::close(poller_fd_);
    }
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  IoPoller(IoPoller&& other) noexcept
      : poller_fd_(other.poller_fd_), results_{}, count_(0) {
    other.poller_fd_ = -1;
    other.count_ = 0;
  }

  IoPoller& operator=(IoPoller&& other) noexcept {
    if (this != &other) {
      if (poller_fd_ >= 0) {
        ::close(poller_fd_);
      }
      poller_fd_ = other.poller_fd_;
      count_ = 0;
      other.poller_fd_ = -1;
      other.count_ = 0;
    }
    return *this;
  }

  bool IsValid() const noexcept { return poller_fd_ >= 0; }
  int32_t Fd() const noexcept { return poller_fd_; }

  /** @brief Add an fd to monitor with given events (kReadable, kWritable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events) {
    struct epoll_event ev {};
    ev.events = 0;
    if (events & static_cast<uint8_t>(IoEvent::kReadable)) ev.events |= EPOLLIN;
    if (events & static_cast<uint8_t>(IoEvent::kWritable)) ev.events |= EPOLLOUT;
    ev.data.fd = fd;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    return expected<void, PollerError>::success();
  }

  expected<void, PollerError> Remove(int32_t fd) {
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for events; results are available through Results().
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready fds. An interrupted wait (EINTR) reports 0.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    struct epoll_event raw[FERRY_IO_POLLER_MAX_EVENTS];
    int32_t n = ::epoll_wait(poller_fd_, raw,
                             static_cast<int>(FERRY_IO_POLLER_MAX_EVENTS),
                             timeout_ms);
    if (n < 0) {
      count_ = 0;
      if (errno == EINTR) {
        return expected<uint32_t, PollerError>::success(0U);
      }
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    count_ = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < count_; ++i) {
      uint8_t ev = 0;
      if (raw[i].events & EPOLLIN) ev |= static_cast<uint8_t>(IoEvent::kReadable);
      if (raw[i].events & EPOLLOUT) ev |= static_cast<uint8_t>(IoEvent::kWritable);
      if (raw[i].events & EPOLLERR) ev |= static_cast<uint8_t>(IoEvent::kError);
      if (raw[i].events & EPOLLHUP) ev |= static_cast<uint8_t>(IoEvent::kHangup);
      results_[i].fd = raw[i].data.fd;
      results_[i].events = ev;
    }
    return expected<uint32_t, PollerError>::success(count_);
  }

  /** @brief Results from the last Wait() call. */
  const PollResult* Results() const noexcept { return results_.data(); }
  uint32_t ResultCount() const noexcept { return count_; }

 private:
  int32_t poller_fd_;
  std::array<PollResult, FERRY_IO_POLLER_MAX_EVENTS> results_;
  uint32_t count_;
};

}  // namespace ferry

#endif  // FERRY_IO_POLLER_HPP_
