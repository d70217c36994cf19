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
 * @file sender.hpp
 * @brief One persistent, self-healing connection to one receiver.
 *
 * SenderConnection keeps a single TCP stream to its destination, reconnects
 * with a fixed backoff whenever the stream breaks and transfers one file per
 * Send() call as a frame followed by a one byte ACK/NACK.
 *
 * A SenderConnection is driven by one thread. Stop() may be called from any
 * thread to interrupt a backoff wait or a blocked transfer.
 */

#ifndef FERRY_SENDER_HPP_
#define FERRY_SENDER_HPP_

#include "ferry/digest.hpp"
#include "ferry/frame.hpp"
#include "ferry/log.hpp"
#include "ferry/platform.hpp"
#include "ferry/socket.hpp"
#include "ferry/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ferry {

// ============================================================================
// Destination
// ============================================================================

struct Destination {
  std::string host;
  uint16_t port = 0;

  std::string ToString() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief Parse "host:port". Surrounding blanks are ignored; the port must be
 * in 1..65535.
 */
inline expected<Destination, ConfigError> ParseDestination(
    const std::string& text) {
  size_t b = text.find_first_not_of(" \t");
  size_t e = text.find_last_not_of(" \t");
  if (b == std::string::npos) {
    return expected<Destination, ConfigError>::error(ConfigError::kMissingValue);
  }
  const std::string t = text.substr(b, e - b + 1U);
  const size_t colon = t.rfind(':');
  if (colon == std::string::npos || colon == 0U || colon + 1U == t.size()) {
    return expected<Destination, ConfigError>::error(ConfigError::kInvalidValue);
  }
  const std::string port_text = t.substr(colon + 1U);
  char* end = nullptr;
  errno = 0;
  long port = std::strtol(port_text.c_str(), &end, 10);
  if (errno != 0 || end == port_text.c_str() || *end != '\0' || port < 1 ||
      port > 65535) {
    return expected<Destination, ConfigError>::error(ConfigError::kInvalidValue);
  }
  Destination d;
  d.host = t.substr(0, colon);
  d.port = static_cast<uint16_t>(port);
  return expected<Destination, ConfigError>::success(std::move(d));
}

// ============================================================================
// SendError / SenderOptions
// ============================================================================

enum class SendError : uint8_t {
  kConnection = 0,  ///< Stream broke during write or ACK read.
  kRejected,        ///< Receiver answered NACK.
  kInvalidName,     ///< Relative name cannot be framed.
  kFileError,       ///< Source file cannot be opened, mapped or hashed.
  kStopped          ///< Stop() was called.
};

inline const char* SendErrorName(SendError e) noexcept {
  switch (e) {
    case SendError::kConnection:  return "connection error";
    case SendError::kRejected:    return "rejected by receiver";
    case SendError::kInvalidName: return "invalid name";
    case SendError::kFileError:   return "file error";
    case SendError::kStopped:     return "stopped";
    default:                      return "unknown";
  }
}

struct SenderOptions {
  uint32_t backoff_ms = 500;
  uint32_t connect_timeout_ms = 5000;
  /// 0 waits for the ACK byte indefinitely.
  uint32_t ack_timeout_ms = 0;
};

// ============================================================================
// MappedFile
// ============================================================================

/** @brief Read-only private mapping of a whole regular file. */
class MappedFile {
 public:
  MappedFile() noexcept = default;

  ~MappedFile() { Reset(); }

  MappedFile(MappedFile&& other) noexcept
      : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
  }

  MappedFile& operator=(MappedFile&& other) noexcept {
    if (this != &other) {
      Reset();
      data_ = other.data_;
      size_ = other.size_;
      other.data_ = nullptr;
      other.size_ = 0;
    }
    return *this;
  }

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  /**
   * @brief Map @p path read-only. Zero-length files map to an empty view
   * without calling mmap.
   *
   * Failures are logged here with the errno of the failing call; the
   * returned kFileError carries no further detail.
   */
  static expected<MappedFile, SendError> Open(const char* path) noexcept {
    int32_t fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      FERRY_LOG_ERROR("Sender", "Cannot open %s: %s", path,
                      std::strerror(errno));
      return expected<MappedFile, SendError>::error(SendError::kFileError);
    }
    FERRY_SCOPE_EXIT(::close(fd));

    struct stat st;
    if (::fstat(fd, &st) != 0) {
      FERRY_LOG_ERROR("Sender", "Cannot stat %s: %s", path,
                      std::strerror(errno));
      return expected<MappedFile, SendError>::error(SendError::kFileError);
    }
    if (!S_ISREG(st.st_mode)) {
      FERRY_LOG_ERROR("Sender", "Cannot read %s: not a regular file", path);
      return expected<MappedFile, SendError>::error(SendError::kFileError);
    }
    MappedFile mf;
    if (st.st_size == 0) {
      return expected<MappedFile, SendError>::success(std::move(mf));
    }
    void* p = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ,
                     MAP_PRIVATE, fd, 0);
    if (p == MAP_FAILED) {
      FERRY_LOG_ERROR("Sender", "Cannot map %s: %s", path,
                      std::strerror(errno));
      return expected<MappedFile, SendError>::error(SendError::kFileError);
    }
    (void)::madvise(p, static_cast<size_t>(st.st_size), MADV_SEQUENTIAL);
    mf.data_ = static_cast<uint8_t*>(p);
    mf.size_ = static_cast<size_t>(st.st_size);
    return expected<MappedFile, SendError>::success(std::move(mf));
  }

  const uint8_t* Data() const noexcept { return data_; }
  size_t Size() const noexcept { return size_; }

 private:
  void Reset() noexcept {
    if (data_ != nullptr) {
      ::munmap(data_, size_);
      data_ = nullptr;
      size_ = 0;
    }
  }

  uint8_t* data_ = nullptr;
  size_t size_ = 0;
};

// ============================================================================
// SenderConnection
// ============================================================================

class SenderConnection {
 public:
  SenderConnection(Destination dest, SenderOptions opts)
      : dest_(std::move(dest)), opts_(opts) {
    label_ = dest_.ToString();
  }

  SenderConnection(const SenderConnection&) = delete;
  SenderConnection& operator=(const SenderConnection&) = delete;

  /**
   * @brief Block until connected or stopped.
   *
   * Retries every backoff_ms with no upper bound. The first failure of a
   * series is logged as a warning, the rest at debug level.
   */
  expected<void, SendError> Connect() {
    uint64_t attempt = 0;
    while (!IsStopped()) {
      auto r = ConnectOnce();
      if (r.has_value()) {
        if (attempt > 0U) {
          FERRY_LOG_INFO("Sender", "Connected to %s after %llu retries",
                         label_.c_str(),
                         static_cast<unsigned long long>(attempt));
        } else {
          FERRY_LOG_INFO("Sender", "Connected to %s", label_.c_str());
        }
        return expected<void, SendError>::success();
      }
      if (attempt == 0U) {
        FERRY_LOG_WARN("Sender", "Cannot connect to %s (%s), retrying every %u ms",
                       label_.c_str(), SocketErrorName(r.get_error()),
                       opts_.backoff_ms);
      } else {
        FERRY_LOG_DEBUG("Sender", "Connect to %s failed: %s", label_.c_str(),
                        SocketErrorName(r.get_error()));
      }
      ++attempt;
      if (!WaitBackoff()) break;
    }
    return expected<void, SendError>::error(SendError::kStopped);
  }

  /**
   * @brief Transfer one file and wait for the receiver's verdict.
   *
   * A connection failure triggers a reconnect and one resend; a NACK
   * triggers one resend on the same stream. Every attempt re-reads and
   * re-hashes @p path.
   */
  expected<void, SendError> Send(const std::string& path,
                                 const std::string& name) {
    if (!ValidateName(name).has_value()) {
      FERRY_LOG_ERROR("Sender", "Cannot frame name '%s'", name.c_str());
      return expected<void, SendError>::error(SendError::kInvalidName);
    }
    if (IsStopped()) {
      return expected<void, SendError>::error(SendError::kStopped);
    }
    if (!IsConnected()) {
      auto c = Connect();
      if (!c.has_value()) return c;
    }

    auto r = SendOnce(path, name);
    if (r.has_value()) return r;

    switch (r.get_error()) {
      case SendError::kConnection: {
        FERRY_LOG_WARN("Sender", "Link to %s broke while sending %s, resending",
                       label_.c_str(), name.c_str());
        auto c = Connect();
        if (!c.has_value()) return c;
        ++resends_;
        return SendOnce(path, name);
      }
      case SendError::kRejected:
        FERRY_LOG_WARN("Sender", "%s rejected %s, resending", label_.c_str(),
                       name.c_str());
        ++resends_;
        return SendOnce(path, name);
      default:
        return r;
    }
  }

  /** @brief Interrupt backoff waits and blocked I/O; later sends fail. */
  void Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    sock_.ShutdownBoth();
    cv_.notify_all();
  }

  bool IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sock_.IsValid();
  }

  const Destination& Dest() const noexcept { return dest_; }
  uint64_t Resends() const noexcept { return resends_.load(); }

 private:
  expected<void, SocketError> ConnectOnce() {
    auto addr = SocketAddress::Resolve(dest_.host.c_str(), dest_.port);
    if (!addr.has_value()) {
      return expected<void, SocketError>::error(addr.get_error());
    }
    auto s = TcpSocket::Create();
    if (!s.has_value()) {
      return expected<void, SocketError>::error(s.get_error());
    }
    TcpSocket sock = std::move(s.value());
    auto nd = sock.SetNoDelay(true);
    if (!nd.has_value()) return nd;
    auto c = (opts_.connect_timeout_ms > 0U)
                 ? sock.Connect(addr.value(), opts_.connect_timeout_ms)
                 : sock.Connect(addr.value());
    if (!c.has_value()) return c;
    if (opts_.ack_timeout_ms > 0U) {
      auto t = sock.SetRecvTimeout(opts_.ack_timeout_ms);
      if (!t.has_value()) return t;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return expected<void, SocketError>::error(SocketError::kClosed);
    }
    sock_ = std::move(sock);
    return expected<void, SocketError>::success();
  }

  expected<void, SendError> SendOnce(const std::string& path,
                                     const std::string& name) {
    auto file = MappedFile::Open(path.c_str());
    if (!file.has_value()) {
      return expected<void, SendError>::error(SendError::kFileError);
    }
    const MappedFile& mf = file.value();
    auto digest = HashBytes(mf.Data(), mf.Size());
    if (!digest.has_value()) {
      return expected<void, SendError>::error(SendError::kFileError);
    }
    auto header = EncodeFrameHeader(name, static_cast<uint64_t>(mf.Size()),
                                    digest.value());
    if (!header.has_value()) {
      return expected<void, SendError>::error(SendError::kInvalidName);
    }

    const std::vector<uint8_t>& h = header.value();
    if (!sock_.SendAll(h.data(), h.size()).has_value() ||
        (mf.Size() > 0U && !sock_.SendAll(mf.Data(), mf.Size()).has_value())) {
      return Broken();
    }
    uint8_t verdict = kNackByte;
    auto r = sock_.RecvAll(&verdict, 1U);
    if (!r.has_value() || r.value() != 1U) {
      return Broken();
    }
    if (verdict == kAckByte) {
      return expected<void, SendError>::success();
    }
    if (verdict != kNackByte) {
      FERRY_LOG_ERROR("Sender", "Unexpected reply 0x%02x from %s",
                      static_cast<unsigned>(verdict), label_.c_str());
      return Broken();
    }
    return expected<void, SendError>::error(SendError::kRejected);
  }

  expected<void, SendError> Broken() {
    std::lock_guard<std::mutex> lock(mutex_);
    sock_.Close();
    return expected<void, SendError>::error(
        stopped_ ? SendError::kStopped : SendError::kConnection);
  }

  /// @return false if Stop() ended the wait.
  bool WaitBackoff() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(opts_.backoff_ms),
                 [this]() { return stopped_; });
    return !stopped_;
  }

  Destination dest_;
  SenderOptions opts_;
  std::string label_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
  TcpSocket sock_;
  std::atomic<uint64_t> resends_{0};
};

}  // namespace ferry

#endif  // FERRY_SENDER_HPP_
