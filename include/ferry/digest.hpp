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
 * @file digest.hpp
 * @brief Whole-file content digest (BLAKE3, 32-byte output).
 *
 * The same digest is computed by the sender to build a frame and by the
 * receiver to verify it, so the function must stay pure: equal bytes in,
 * equal 32 bytes out. The empty input hashes to BLAKE3("").
 */

#ifndef FERRY_DIGEST_HPP_
#define FERRY_DIGEST_HPP_

#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <blake3.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ferry {

constexpr size_t kDigestSize = BLAKE3_OUT_LEN;

using Digest = std::array<uint8_t, kDigestSize>;

enum class DigestError : uint8_t {
  kContextFailed = 0,
  kUpdateFailed,
  kFinalFailed,
  kFileOpenFailed,
  kFileReadFailed
};

// ============================================================================
// Hasher - streaming digest
// ============================================================================

/**
 * @brief Incremental BLAKE3. Feed chunks with Update(), then Finalize() once.
 *
 * A finalized hasher rejects further Update()/Finalize() calls until it is
 * replaced by a fresh one from Create().
 */
class Hasher {
 public:
  static expected<Hasher, DigestError> Create() {
    Hasher h;
    ::blake3_hasher_init(&h.state_);
    h.live_ = true;
    return expected<Hasher, DigestError>::success(std::move(h));
  }

  Hasher() = default;
  Hasher(Hasher&&) noexcept = default;
  Hasher& operator=(Hasher&&) noexcept = default;
  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;

  expected<void, DigestError> Update(const void* data, size_t len) noexcept {
    if (!live_) {
      return expected<void, DigestError>::error(DigestError::kUpdateFailed);
    }
    if (len == 0U) return expected<void, DigestError>::success();
    ::blake3_hasher_update(&state_, data, len);
    return expected<void, DigestError>::success();
  }

  expected<Digest, DigestError> Finalize() noexcept {
    if (!live_) {
      return expected<Digest, DigestError>::error(DigestError::kFinalFailed);
    }
    Digest d;
    ::blake3_hasher_finalize(&state_, d.data(), d.size());
    live_ = false;
    return expected<Digest, DigestError>::success(d);
  }

  bool IsLive() const noexcept { return live_; }

 private:
  blake3_hasher state_{};
  bool live_ = false;
};

// ============================================================================
// One-shot helpers
// ============================================================================

inline expected<Digest, DigestError> HashBytes(const void* data, size_t len) {
  auto h = Hasher::Create();
  if (!h.has_value()) {
    return expected<Digest, DigestError>::error(h.get_error());
  }
  auto u = h.value().Update(data, len);
  if (!u.has_value()) {
    return expected<Digest, DigestError>::error(u.get_error());
  }
  return h.value().Finalize();
}

/**
 * @brief Stream a file through the hasher in @p chunk_size pieces.
 */
inline expected<Digest, DigestError> HashFile(const char* path,
                                              size_t chunk_size = 1U << 20) {
  int32_t fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return expected<Digest, DigestError>::error(DigestError::kFileOpenFailed);
  }
  FERRY_SCOPE_EXIT(::close(fd));

  auto h = Hasher::Create();
  if (!h.has_value()) {
    return expected<Digest, DigestError>::error(h.get_error());
  }
  std::vector<uint8_t> buf(chunk_size == 0U ? 4096U : chunk_size);
  for (;;) {
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return expected<Digest, DigestError>::error(DigestError::kFileReadFailed);
    }
    if (n == 0) break;
    auto u = h.value().Update(buf.data(), static_cast<size_t>(n));
    if (!u.has_value()) {
      return expected<Digest, DigestError>::error(u.get_error());
    }
  }
  return h.value().Finalize();
}

inline const char* DigestErrorName(DigestError e) noexcept {
  switch (e) {
    case DigestError::kContextFailed:  return "context failed";
    case DigestError::kUpdateFailed:   return "update failed";
    case DigestError::kFinalFailed:    return "finalize failed";
    case DigestError::kFileOpenFailed: return "cannot open file";
    case DigestError::kFileReadFailed: return "cannot read file";
    default:                           return "unknown";
  }
}

/** @brief Lowercase hex rendering, for log lines. */
inline std::string DigestToHex(const Digest& d) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(kDigestSize * 2U);
  for (uint8_t b : d) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0FU]);
  }
  return out;
}

}  // namespace ferry

#endif  // FERRY_DIGEST_HPP_
