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
 * @file watcher.hpp
 * @brief Recursive inotify watcher and the loop that feeds a FileSink.
 *
 * DirWatcher keeps one inotify watch per directory under the root, keyed by
 * watch descriptor. New subdirectories are registered as their creation is
 * reported, and files already inside them are reported as stable, since they
 * may have been written before the watch existed.
 *
 * WatchLoop turns "file stable" events into FileSink::Deliver(path, name)
 * calls, where name is the path relative to the watch root.
 */

#ifndef FERRY_WATCHER_HPP_
#define FERRY_WATCHER_HPP_

#include "ferry/dispatcher.hpp"
#include "ferry/io_poller.hpp"
#include "ferry/log.hpp"
#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sys/inotify.h>
#include <unistd.h>

namespace ferry {

// ============================================================================
// Types
// ============================================================================

enum class WatchError : uint8_t {
  kInitFailed = 0,
  kNotADirectory,
  kAddWatchFailed,
  kReadFailed,
  kPollFailed
};

inline const char* WatchErrorName(WatchError e) noexcept {
  switch (e) {
    case WatchError::kInitFailed:     return "inotify init failed";
    case WatchError::kNotADirectory:  return "not a directory";
    case WatchError::kAddWatchFailed: return "add watch failed";
    case WatchError::kReadFailed:     return "read failed";
    case WatchError::kPollFailed:     return "poll failed";
    default:                          return "unknown";
  }
}

enum class WatchEventKind : uint8_t {
  kFileStable = 0,     ///< Closed after writing, or moved into the tree.
  kDirectoryCreated,
  kOverflow            ///< Kernel queue overflowed; events were lost.
};

struct WatchEvent {
  WatchEventKind kind;
  std::string path;
};

/**
 * @brief Path of @p path relative to @p root with '/' separators.
 * @return Empty string if @p path is not strictly inside @p root.
 */
inline std::string RelativeName(const std::filesystem::path& root,
                                const std::filesystem::path& path) {
  std::filesystem::path base = root.lexically_normal();
  if (!base.has_filename() && base.has_parent_path() &&
      base != base.root_path()) {
    base = base.parent_path();
  }
  const std::filesystem::path rel =
      path.lexically_normal().lexically_relative(base);
  if (rel.empty() || rel == ".") return std::string();
  auto first = rel.begin();
  if (*first == "..") return std::string();
  return rel.generic_string();
}

// ============================================================================
// DirWatcher
// ============================================================================

class DirWatcher {
 public:
  static constexpr uint32_t kDirMask =
      IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_ONLYDIR;

  DirWatcher() noexcept = default;

  ~DirWatcher() { Close(); }

  DirWatcher(const DirWatcher&) = delete;
  DirWatcher& operator=(const DirWatcher&) = delete;

  /** @brief Watch @p root and every directory below it. */
  expected<void, WatchError> Open(const std::string& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
      return expected<void, WatchError>::error(WatchError::kNotADirectory);
    }
    std::filesystem::path abs = std::filesystem::absolute(root, ec);
    if (ec) abs = root;
    root_ = abs.lexically_normal();
    if (!root_.has_filename() && root_ != root_.root_path()) {
      root_ = root_.parent_path();
    }

    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
      return expected<void, WatchError>::error(WatchError::kInitFailed);
    }
    if (!poller_.IsValid() ||
        !poller_.Add(fd_, static_cast<uint8_t>(IoEvent::kReadable))
             .has_value()) {
      Close();
      return expected<void, WatchError>::error(WatchError::kInitFailed);
    }
    auto r = AddRecursive(root_.string(), nullptr);
    if (!r.has_value()) {
      Close();
      return r;
    }
    FERRY_LOG_INFO("Watch", "Watching %s (%zu directories)",
                   root_.c_str(), watches_.size());
    return expected<void, WatchError>::success();
  }

  /**
   * @brief Wait up to @p timeout_ms for events and append them to @p out.
   * @return Number of events appended; 0 on timeout.
   */
  expected<uint32_t, WatchError> Poll(int32_t timeout_ms,
                                      std::vector<WatchEvent>& out) {
    auto w = poller_.Wait(timeout_ms);
    if (!w.has_value()) {
      return expected<uint32_t, WatchError>::error(WatchError::kPollFailed);
    }
    if (w.value() == 0U) {
      return expected<uint32_t, WatchError>::success(0U);
    }
    const size_t before = out.size();
    alignas(struct inotify_event) char buf[16384];
    for (;;) {
      ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        return expected<uint32_t, WatchError>::error(WatchError::kReadFailed);
      }
      if (n == 0) break;
      size_t off = 0;
      while (off + sizeof(struct inotify_event) <= static_cast<size_t>(n)) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(buf + off);
        HandleRaw(*ev, out);
        off += sizeof(struct inotify_event) + ev->len;
      }
    }
    return expected<uint32_t, WatchError>::success(
        static_cast<uint32_t>(out.size() - before));
  }

  const std::filesystem::path& Root() const noexcept { return root_; }
  size_t WatchCount() const noexcept { return watches_.size(); }
  bool IsOpen() const noexcept { return fd_ >= 0; }

  void Close() noexcept {
    if (fd_ >= 0) {
      (void)poller_.Remove(fd_);
      ::close(fd_);
      fd_ = -1;
    }
    watches_.clear();
  }

 private:
  /// Watch @p dir and its subdirectories. With @p found, regular files
  /// already present are reported as stable.
  expected<void, WatchError> AddRecursive(const std::string& dir,
                                          std::vector<WatchEvent>* found) {
    auto r = AddOne(dir);
    if (!r.has_value()) return r;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code sec;
      const auto status = it->symlink_status(sec);
      if (sec) continue;
      if (std::filesystem::is_directory(status)) {
        auto sub = AddOne(it->path().string());
        if (!sub.has_value()) {
          FERRY_LOG_WARN("Watch", "Cannot watch %s: %s", it->path().c_str(),
                         std::strerror(errno));
        }
      } else if (found != nullptr && std::filesystem::is_regular_file(status)) {
        found->push_back({WatchEventKind::kFileStable, it->path().string()});
      }
    }
    if (ec) {
      FERRY_LOG_WARN("Watch", "Scan of %s incomplete: %s", dir.c_str(),
                     ec.message().c_str());
    }
    return expected<void, WatchError>::success();
  }

  expected<void, WatchError> AddOne(const std::string& dir) {
    int32_t wd = ::inotify_add_watch(fd_, dir.c_str(), kDirMask);
    if (wd < 0) {
      return expected<void, WatchError>::error(WatchError::kAddWatchFailed);
    }
    watches_[wd] = dir;
    FERRY_LOG_DEBUG("Watch", "Added watch %d on %s", wd, dir.c_str());
    return expected<void, WatchError>::success();
  }

  void HandleRaw(const struct inotify_event& ev, std::vector<WatchEvent>& out) {
    if ((ev.mask & IN_Q_OVERFLOW) != 0U) {
      FERRY_LOG_WARN("Watch", "inotify queue overflow, events lost");
      out.push_back({WatchEventKind::kOverflow, root_.string()});
      return;
    }
    auto it = watches_.find(ev.wd);
    if (it == watches_.end()) return;
    if ((ev.mask & IN_IGNORED) != 0U) {
      watches_.erase(it);
      return;
    }
    if (ev.len == 0U) return;

    const std::string full = it->second + "/" + ev.name;
    if ((ev.mask & IN_ISDIR) != 0U) {
      if ((ev.mask & (IN_CREATE | IN_MOVED_TO)) != 0U) {
        out.push_back({WatchEventKind::kDirectoryCreated, full});
        auto r = AddRecursive(full, &out);
        if (!r.has_value()) {
          FERRY_LOG_WARN("Watch", "Cannot watch new directory %s: %s",
                         full.c_str(), std::strerror(errno));
        }
      }
      return;
    }
    if ((ev.mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) != 0U) {
      out.push_back({WatchEventKind::kFileStable, full});
    }
  }

  int32_t fd_ = -1;
  IoPoller poller_;
  std::filesystem::path root_;
  std::unordered_map<int32_t, std::string> watches_;
};

// ============================================================================
// WatchLoop
// ============================================================================

struct WatchOptions {
  uint32_t settle_delay_ms = 1;
  int32_t poll_timeout_ms = 200;
};

class WatchLoop {
 public:
  WatchLoop(DirWatcher& watcher, FileSink& sink, WatchOptions opts = {})
      : watcher_(watcher), sink_(sink), opts_(opts) {}

  WatchLoop(const WatchLoop&) = delete;
  WatchLoop& operator=(const WatchLoop&) = delete;

  /**
   * @brief Process events until Stop().
   *
   * Only a poll or read failure on the inotify descriptor ends the loop with
   * an error; per-file problems are left to the sink.
   */
  expected<void, WatchError> Run() {
    std::vector<WatchEvent> events;
    while (!stop_.load()) {
      events.clear();
      auto r = watcher_.Poll(opts_.poll_timeout_ms, events);
      if (!r.has_value()) {
        FERRY_LOG_ERROR("Watch", "Event source failed: %s",
                        WatchErrorName(r.get_error()));
        return expected<void, WatchError>::error(r.get_error());
      }
      for (const auto& ev : events) {
        if (stop_.load()) break;
        (void)HandleEvent(ev);
      }
    }
    return expected<void, WatchError>::success();
  }

  void Stop() noexcept { stop_.store(true); }

  /**
   * @brief Forward one event to the sink if it names a regular file inside
   * the root.
   * @return true if the sink was called.
   */
  bool HandleEvent(const WatchEvent& ev) {
    if (ev.kind != WatchEventKind::kFileStable) return false;
    if (opts_.settle_delay_ms > 0U) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(opts_.settle_delay_ms));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(ev.path, ec)) {
      FERRY_LOG_DEBUG("Watch", "Skipping %s: not a regular file",
                      ev.path.c_str());
      return false;
    }
    const std::string name = RelativeName(watcher_.Root(), ev.path);
    if (name.empty()) {
      FERRY_LOG_DEBUG("Watch", "Skipping %s: outside %s", ev.path.c_str(),
                      watcher_.Root().c_str());
      return false;
    }
    FERRY_LOG_DEBUG("Watch", "Stable: %s", name.c_str());
    sink_.Deliver(ev.path, name);
    dispatched_.fetch_add(1U);
    return true;
  }

  uint64_t Dispatched() const noexcept { return dispatched_.load(); }

 private:
  DirWatcher& watcher_;
  FileSink& sink_;
  WatchOptions opts_;
  std::atomic<bool> stop_{false};
  std::atomic<uint64_t> dispatched_{0};
};

}  // namespace ferry

#endif  // FERRY_WATCHER_HPP_
