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
 * @file shutdown.hpp
 * @brief Signal-driven process shutdown for the ferry daemons.
 *
 * SIGINT/SIGTERM (or Quit()) wake WaitForShutdown() through a self-pipe;
 * the registered stop callbacks then run in LIFO order, so components are
 * torn down in reverse start order.
 */

#ifndef FERRY_SHUTDOWN_HPP_
#define FERRY_SHUTDOWN_HPP_

#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace ferry {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Stop callback. @p signo is 0 for a manual Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may be active per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Owns the signal handlers and the stop callbacks of one process.
 *
 * Usage:
 * @code
 *   ferry::ShutdownManager mgr;
 *   mgr.Register([](int, void* rx) { static_cast<Receiver*>(rx)->Stop(); },
 *                &receiver);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  ShutdownManager() noexcept : callback_count_(0), shutdown_flag_(false),
                               valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) return;
    detail::GetShutdownInstance() = this;
    if (::pipe2(pipe_fd_, O_CLOEXEC) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// False for a second instance or when the pipe could not be created.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_] = {fn, ctx};
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  /**
   * @brief Route SIGINT and SIGTERM to this instance; ignore SIGPIPE so a
   * dropped peer surfaces as EPIPE instead of killing the process.
   */
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    ::sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    if (::sigaction(SIGPIPE, &ign, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /** @brief Request shutdown from code, e.g. after a fatal component error. */
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /** @brief Block until a signal or Quit(), then run callbacks LIFO. */
  void WaitForShutdown() noexcept {
    while (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      uint8_t buf = 0;
      ssize_t n = ::read(pipe_fd_[0], &buf, 1);
      if (n > 0 || (n < 0 && errno != EINTR)) break;
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }
  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  static constexpr uint32_t kMaxCallbacks = 16;

  struct Callback {
    ShutdownFn fn;
    void* ctx;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  /// Async-signal-safe: atomics and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->shutdown_flag_.store(true);
      self->signo_.store(signo, std::memory_order_relaxed);
      self->Wake();
    }
  }

  Callback callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_;
  std::atomic<bool> shutdown_flag_;
  int pipe_fd_[2];
  std::atomic<int> signo_{0};
  bool valid_;
};

}  // namespace ferry

#endif  // FERRY_SHUTDOWN_HPP_
