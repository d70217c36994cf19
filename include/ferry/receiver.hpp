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
 * @file receiver.hpp
 * @brief Receive-verify-publish side of the replication protocol.
 *
 * ReceiverSession serves one accepted connection:
 *
 *   kAwaitHeader -> kReceivePayload -> kVerify -> kPublish -> kAwaitHeader
 *         |                |
 *         +----------------+--> kClosed (peer close, stream error)
 *
 * Each frame is written to its own "<final>.part.XXXXXX", hashed while it
 * streams in,
 * fsync'ed, compared with the frame checksum and rename(2)d onto the final
 * name. A consumer of the destination directory therefore never sees a
 * partial file under its final name.
 *
 * Receiver owns the listening socket and runs one session thread per
 * accepted connection. Sessions share nothing but the filesystem.
 */

#ifndef FERRY_RECEIVER_HPP_
#define FERRY_RECEIVER_HPP_

#include "ferry/digest.hpp"
#include "ferry/frame.hpp"
#include "ferry/io_poller.hpp"
#include "ferry/log.hpp"
#include "ferry/platform.hpp"
#include "ferry/socket.hpp"
#include "ferry/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry {

// ============================================================================
// Types
// ============================================================================

enum class ReceiveError : uint8_t {
  kProtocol = 0,   ///< Stream desynchronized; the connection is closed.
  kIo,             ///< Socket error while reading or acknowledging.
  kUnsafePath,     ///< Frame name escapes the destination root.
  kFilesystem,     ///< Directory, temp file or rename failure.
  kDigest,         ///< Hasher could not be created.
  kBindFailed,
  kAlreadyRunning
};

inline const char* ReceiveErrorName(ReceiveError e) noexcept {
  switch (e) {
    case ReceiveError::kProtocol:       return "protocol error";
    case ReceiveError::kIo:             return "I/O error";
    case ReceiveError::kUnsafePath:     return "unsafe path";
    case ReceiveError::kFilesystem:     return "filesystem error";
    case ReceiveError::kDigest:         return "digest error";
    case ReceiveError::kBindFailed:     return "bind failed";
    case ReceiveError::kAlreadyRunning: return "already running";
    default:                            return "unknown";
  }
}

enum class SessionState : uint8_t {
  kAwaitHeader = 0,
  kReceivePayload,
  kVerify,
  kPublish,
  kClosed
};

inline const char* SessionStateName(SessionState s) noexcept {
  switch (s) {
    case SessionState::kAwaitHeader:    return "AWAIT_HEADER";
    case SessionState::kReceivePayload: return "RECEIVE_PAYLOAD";
    case SessionState::kVerify:         return "VERIFY";
    case SessionState::kPublish:        return "PUBLISH";
    case SessionState::kClosed:         return "CLOSED";
    default:                            return "?";
  }
}

/// Observability hook invoked on every state change.
using TransitionHook = void (*)(SessionState from, SessionState to, void* ctx);

struct ReceiverOptions {
  std::string dest_dir;
  size_t chunk_size = 1U << 20;
  TransitionHook on_transition = nullptr;
  void* hook_ctx = nullptr;
};

struct SessionStats {
  uint64_t published = 0;
  uint64_t rejected = 0;
  uint64_t bytes = 0;
};

// ============================================================================
// Path helpers
// ============================================================================

/**
 * @brief Join @p root and a wire name, refusing anything that would land
 * outside @p root.
 *
 * Rejected: empty names, absolute names, names containing NUL, any ".."
 * component, and names that normalise to the root itself.
 */
inline expected<std::filesystem::path, ReceiveError> ResolveDestination(
    const std::filesystem::path& root, const std::string& name) {
  using Result = expected<std::filesystem::path, ReceiveError>;
  if (name.empty() || name.find('\0') != std::string::npos) {
    return Result::error(ReceiveError::kUnsafePath);
  }
  const std::filesystem::path rel(name);
  if (rel.is_absolute() || rel.has_root_path()) {
    return Result::error(ReceiveError::kUnsafePath);
  }
  for (const auto& part : rel) {
    if (part == "..") return Result::error(ReceiveError::kUnsafePath);
  }
  const std::filesystem::path normal = rel.lexically_normal();
  if (normal.empty() || normal == "." || !normal.has_filename()) {
    return Result::error(ReceiveError::kUnsafePath);
  }
  return Result::success(root / normal);
}

inline std::filesystem::path PartPath(const std::filesystem::path& final_path) {
  std::filesystem::path p = final_path;
  p += ".part";
  return p;
}

namespace detail {

inline bool WriteFully(int32_t fd, const uint8_t* data, size_t len) noexcept {
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::write(fd, data + done, len - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

/**
 * @brief Create a private temp file "<final>.part.XXXXXX" next to @p final.
 *
 * Each frame gets its own inode, so concurrent sessions writing the same
 * name never interleave their bytes.
 * @return The open fd and @p out set to its path, or -1 with errno set.
 */
inline int32_t CreatePartFile(const std::filesystem::path& final_path,
                              std::filesystem::path& out) {
  std::string tmpl = PartPath(final_path).string() + ".XXXXXX";
  int32_t fd = ::mkostemp(&tmpl[0], O_CLOEXEC);
  if (fd < 0) return -1;
  out = tmpl;
  if (::fchmod(fd, 0644) != 0) {
    const int saved = errno;
    ::close(fd);
    (void)::unlink(tmpl.c_str());
    out.clear();
    errno = saved;
    return -1;
  }
  return fd;
}

/// Make a completed rename durable; failure only costs durability.
inline void SyncDirectory(const std::filesystem::path& dir) noexcept {
  int32_t fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return;
  (void)::fsync(fd);
  ::close(fd);
}

}  // namespace detail

// ============================================================================
// ReceiverSession
// ============================================================================

class ReceiverSession {
 public:
  ReceiverSession(TcpSocket&& sock, const ReceiverOptions& opts)
      : sock_(std::move(sock)),
        opts_(opts),
        root_(opts.dest_dir),
        state_(SessionState::kAwaitHeader),
        buf_(std::max<size_t>(opts.chunk_size, 1U)) {}

  ReceiverSession(const ReceiverSession&) = delete;
  ReceiverSession& operator=(const ReceiverSession&) = delete;

  /**
   * @brief Serve frames until the peer disconnects or the stream breaks.
   * @return success on a clean close between frames.
   */
  expected<void, ReceiveError> Run() {
    for (;;) {
      auto r = ProcessFrame();
      if (!r.has_value()) {
        return expected<void, ReceiveError>::error(r.get_error());
      }
      if (!r.value()) {
        return expected<void, ReceiveError>::success();
      }
    }
  }

  /**
   * @brief Handle exactly one frame.
   * @return true if a frame was handled (ACK or NACK sent), false on a clean
   *         end of session. Errors leave the session in kClosed.
   */
  expected<bool, ReceiveError> ProcessFrame() {
    Transition(SessionState::kAwaitHeader);
    auto hdr = ReadFrameHeader(sock_);
    if (!hdr.has_value()) {
      Transition(SessionState::kClosed);
      if (hdr.get_error() == FrameError::kEndOfStream) {
        FERRY_LOG_INFO("Receiver", "Connection closed");
        return expected<bool, ReceiveError>::success(false);
      }
      FERRY_LOG_ERROR("Receiver", "Bad frame header: %s",
                      FrameErrorName(hdr.get_error()));
      return expected<bool, ReceiveError>::error(
          hdr.get_error() == FrameError::kIoError ? ReceiveError::kIo
                                                  : ReceiveError::kProtocol);
    }
    const FrameHeader& h = hdr.value();
    Transition(SessionState::kReceivePayload);

    auto hasher = Hasher::Create();
    if (!hasher.has_value()) {
      Transition(SessionState::kClosed);
      return expected<bool, ReceiveError>::error(ReceiveError::kDigest);
    }

    // Decide where the payload goes before touching the filesystem.
    auto dest = ResolveDestination(root_, h.name);
    std::filesystem::path part;
    int32_t fd = -1;
    if (!dest.has_value()) {
      FERRY_LOG_ERROR("Receiver", "Rejecting unsafe name '%s'", h.name.c_str());
    } else {
      std::error_code ec;
      std::filesystem::create_directories(dest.value().parent_path(), ec);
      if (ec) {
        FERRY_LOG_ERROR("Receiver", "Cannot create directory for %s: %s",
                        h.name.c_str(), ec.message().c_str());
      } else {
        fd = detail::CreatePartFile(dest.value(), part);
        if (fd < 0) {
          FERRY_LOG_ERROR("Receiver", "Cannot create temp file for %s: %s",
                          h.name.c_str(), std::strerror(errno));
        }
      }
    }

    bool published = false;
    ScopeGuard cleanup([&]() {
      if (fd >= 0) ::close(fd);
      if (!part.empty() && !published) {
        std::error_code ec;
        std::filesystem::remove(part, ec);
      }
    });

    // The payload is always consumed in full so the stream stays in sync,
    // even when it cannot be stored.
    bool stored = (fd >= 0);
    uint64_t remaining = h.size;
    while (remaining > 0U) {
      const size_t want = static_cast<size_t>(
          std::min<uint64_t>(remaining, static_cast<uint64_t>(buf_.size())));
      auto r = sock_.RecvAll(buf_.data(), want);
      if (!r.has_value() || r.value() < want) {
        FERRY_LOG_ERROR("Receiver", "Stream ended inside payload of %s",
                        h.name.c_str());
        Transition(SessionState::kClosed);
        return expected<bool, ReceiveError>::error(
            r.has_value() ? ReceiveError::kProtocol : ReceiveError::kIo);
      }
      if (stored && !hasher.value().Update(buf_.data(), want).has_value()) {
        FERRY_LOG_ERROR("Receiver", "Digest update failed for %s",
                        h.name.c_str());
        stored = false;
      }
      if (stored && !detail::WriteFully(fd, buf_.data(), want)) {
        FERRY_LOG_ERROR("Receiver", "Write to %s failed: %s", part.c_str(),
                        std::strerror(errno));
        stored = false;
      }
      remaining -= want;
      stats_.bytes += want;
    }
    if (stored && ::fsync(fd) != 0) {
      FERRY_LOG_ERROR("Receiver", "fsync %s failed: %s", part.c_str(),
                      std::strerror(errno));
      stored = false;
    }
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }

    Transition(SessionState::kVerify);
    auto got = hasher.value().Finalize();
    if (!stored) {
      return Reject();
    }
    if (!got.has_value() || got.value() != h.checksum) {
      FERRY_LOG_WARN("Receiver", "Checksum mismatch for %s", h.name.c_str());
      return Reject();
    }

    Transition(SessionState::kPublish);
    if (::rename(part.c_str(), dest.value().c_str()) != 0) {
      FERRY_LOG_ERROR("Receiver", "rename %s failed: %s", h.name.c_str(),
                      std::strerror(errno));
      return Reject();
    }
    published = true;
    detail::SyncDirectory(dest.value().parent_path());

    if (!SendVerdict(kAckByte)) {
      return expected<bool, ReceiveError>::error(ReceiveError::kIo);
    }
    ++stats_.published;
    FERRY_LOG_INFO("Receiver", "OK %s (%llu bytes)", h.name.c_str(),
                   static_cast<unsigned long long>(h.size));
    return expected<bool, ReceiveError>::success(true);
  }

  SessionState State() const noexcept { return state_; }
  const SessionStats& Stats() const noexcept { return stats_; }
  int32_t Fd() const noexcept { return sock_.Fd(); }

 private:
  void Transition(SessionState to) noexcept {
    if (to == state_) return;
    const SessionState from = state_;
    state_ = to;
    if (opts_.on_transition != nullptr) {
      opts_.on_transition(from, to, opts_.hook_ctx);
    }
  }

  expected<bool, ReceiveError> Reject() {
    if (!SendVerdict(kNackByte)) {
      return expected<bool, ReceiveError>::error(ReceiveError::kIo);
    }
    ++stats_.rejected;
    return expected<bool, ReceiveError>::success(true);
  }

  bool SendVerdict(uint8_t byte) {
    auto r = sock_.SendAll(&byte, 1U);
    if (!r.has_value()) {
      FERRY_LOG_ERROR("Receiver", "Cannot send %s: %s",
                      byte == kAckByte ? "ACK" : "NACK",
                      SocketErrorName(r.get_error()));
      Transition(SessionState::kClosed);
      return false;
    }
    return true;
  }

  TcpSocket sock_;
  ReceiverOptions opts_;
  std::filesystem::path root_;
  SessionState state_;
  SessionStats stats_;
  std::vector<uint8_t> buf_;
};

// ============================================================================
// Receiver
// ============================================================================

/**
 * @brief Listening server: accepts connections and runs a ReceiverSession
 * for each on its own thread.
 *
 * Usage:
 * @code
 *   ferry::ReceiverOptions opts;
 *   opts.dest_dir = "/destino";
 *   ferry::Receiver rx(opts);
 *   auto r = rx.Start("0.0.0.0", 5001);
 *   ...
 *   rx.Stop();
 * @endcode
 */
class Receiver {
 public:
  explicit Receiver(ReceiverOptions opts) : opts_(std::move(opts)) {}

  ~Receiver() { Stop(); }

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  /**
   * @brief Create the destination root, bind and start accepting.
   *
   * Any failure here is a setup error the caller should treat as fatal.
   */
  expected<void, ReceiveError> Start(const char* bind_ip, uint16_t port,
                                     int32_t backlog = kDefaultBacklog) {
    if (running_.load()) {
      return expected<void, ReceiveError>::error(ReceiveError::kAlreadyRunning);
    }
    std::error_code ec;
    std::filesystem::create_directories(opts_.dest_dir, ec);
    if (ec) {
      FERRY_LOG_ERROR("Receiver", "Cannot create %s: %s",
                      opts_.dest_dir.c_str(), ec.message().c_str());
      return expected<void, ReceiveError>::error(ReceiveError::kFilesystem);
    }

    auto addr = SocketAddress::FromIpv4(bind_ip, port);
    auto lis = TcpListener::Create();
    if (!addr.has_value() || !lis.has_value()) {
      return expected<void, ReceiveError>::error(ReceiveError::kBindFailed);
    }
    listener_ = std::move(lis.value());
    (void)listener_.SetReuseAddr(true);
    if (!listener_.Bind(addr.value()).has_value() ||
        !listener_.Listen(backlog).has_value()) {
      FERRY_LOG_ERROR("Receiver", "Cannot listen on %s:%u: %s", bind_ip,
                      static_cast<unsigned>(port), std::strerror(errno));
      listener_.Close();
      return expected<void, ReceiveError>::error(ReceiveError::kBindFailed);
    }
    if (!poller_.IsValid() ||
        !poller_.Add(listener_.Fd(),
                     static_cast<uint8_t>(IoEvent::kReadable)).has_value()) {
      listener_.Close();
      return expected<void, ReceiveError>::error(ReceiveError::kBindFailed);
    }

    running_.store(true);
    accept_thread_ = std::thread(&Receiver::AcceptLoop, this);
    FERRY_LOG_INFO("Receiver", "Listening on %s:%u, publishing to %s", bind_ip,
                   static_cast<unsigned>(listener_.LocalPort()),
                   opts_.dest_dir.c_str());
    return expected<void, ReceiveError>::success();
  }

  /** @brief Stop accepting, shut down live sessions and join all threads. */
  void Stop() {
    bool was_running = running_.exchange(false);
    if (accept_thread_.joinable()) accept_thread_.join();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& slot : slots_) {
        if (!slot->finished && slot->fd >= 0) {
          (void)::shutdown(slot->fd, SHUT_RDWR);
        }
      }
    }
    ReapSessions(true);
    if (was_running) {
      (void)poller_.Remove(listener_.Fd());
      listener_.Close();
      FERRY_LOG_INFO("Receiver", "Stopped: %llu published, %llu rejected",
                     static_cast<unsigned long long>(published_.load()),
                     static_cast<unsigned long long>(rejected_.load()));
    }
  }

  bool IsRunning() const noexcept { return running_.load(); }
  uint16_t Port() const noexcept { return listener_.LocalPort(); }
  uint64_t TotalPublished() const noexcept { return published_.load(); }
  uint64_t TotalRejected() const noexcept { return rejected_.load(); }
  uint64_t SessionsServed() const noexcept { return sessions_.load(); }

 private:
  struct SessionSlot {
    std::thread thread;
    int32_t fd = -1;
    bool finished = false;
  };

  void AcceptLoop() {
    while (running_.load()) {
      auto w = poller_.Wait(100);
      if (!w.has_value()) {
        FERRY_LOG_ERROR("Receiver", "Poll failed, accept loop exiting");
        break;
      }
      for (uint32_t i = 0; i < w.value(); ++i) {
        if (poller_.Results()[i].fd == listener_.Fd()) AcceptOne();
      }
      ReapSessions(false);
    }
  }

  void AcceptOne() {
    SocketAddress peer;
    auto s = listener_.Accept(peer);
    if (!s.has_value()) {
      FERRY_LOG_WARN("Receiver", "accept: %s", SocketErrorName(s.get_error()));
      return;
    }
    TcpSocket sock = std::move(s.value());
    (void)sock.SetNoDelay(true);
    char peer_buf[32];
    peer.Format(peer_buf, sizeof(peer_buf));
    FERRY_LOG_INFO("Receiver", "Connected from %s", peer_buf);

    auto slot = std::make_unique<SessionSlot>();
    SessionSlot* raw = slot.get();
    raw->fd = sock.Fd();
    std::lock_guard<std::mutex> lock(mutex_);
    raw->thread = std::thread(&Receiver::SessionMain, this, raw,
                              std::move(sock));
    slots_.push_back(std::move(slot));
  }

  void SessionMain(SessionSlot* slot, TcpSocket sock) {
    ReceiverSession session(std::move(sock), opts_);
    auto r = session.Run();
    if (!r.has_value()) {
      FERRY_LOG_WARN("Receiver", "Session ended: %s",
                     ReceiveErrorName(r.get_error()));
    }
    published_.fetch_add(session.Stats().published);
    rejected_.fetch_add(session.Stats().rejected);
    sessions_.fetch_add(1U);
    std::lock_guard<std::mutex> lock(mutex_);
    slot->finished = true;
  }

  void ReapSessions(bool all) {
    std::vector<std::unique_ptr<SessionSlot>> done;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = slots_.begin();
      while (it != slots_.end()) {
        if (all || (*it)->finished) {
          done.push_back(std::move(*it));
          it = slots_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& slot : done) {
      if (slot->thread.joinable()) slot->thread.join();
    }
  }

  ReceiverOptions opts_;
  TcpListener listener_;
  IoPoller poller_;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};

  std::mutex mutex_;
  std::vector<std::unique_ptr<SessionSlot>> slots_;

  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> sessions_{0};
};

}  // namespace ferry

#endif  // FERRY_RECEIVER_HPP_
