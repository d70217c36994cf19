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
 * @file frame.hpp
 * @brief Wire frame codec.
 *
 * Frame layout, big-endian, no padding, no end marker:
 *
 *   +----------------+-------------+-----------+----------------+-----------+
 *   | name_len (u16) | name (UTF-8)| size (u64)| checksum (32B) | payload   |
 *   +----------------+-------------+-----------+----------------+-----------+
 *
 * The receiver answers each frame with one byte: kAckByte or kNackByte.
 * The next frame header follows the previous payload immediately.
 */

#ifndef FERRY_FRAME_HPP_
#define FERRY_FRAME_HPP_

#include "ferry/digest.hpp"
#include "ferry/platform.hpp"
#include "ferry/socket.hpp"
#include "ferry/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace ferry {

// ============================================================================
// Constants
// ============================================================================

constexpr size_t kMaxNameLen = 65535U;
constexpr size_t kNameLenFieldSize = 2U;
constexpr size_t kSizeFieldSize = 8U;
/// Header bytes excluding the name itself.
constexpr size_t kHeaderFixedSize =
    kNameLenFieldSize + kSizeFieldSize + kDigestSize;

constexpr uint8_t kAckByte = 0x01U;
constexpr uint8_t kNackByte = 0x00U;

// ============================================================================
// FrameError
// ============================================================================

enum class FrameError : uint8_t {
  kNameEmpty = 0,
  kNameTooLong,
  kInvalidUtf8,
  kIncomplete,    ///< Stream ended inside a header or payload.
  kEndOfStream,   ///< Stream ended cleanly before a new header.
  kIoError,
  kDigestFailed
};

inline const char* FrameErrorName(FrameError e) noexcept {
  switch (e) {
    case FrameError::kNameEmpty:    return "empty name";
    case FrameError::kNameTooLong:  return "name too long";
    case FrameError::kInvalidUtf8:  return "name is not valid UTF-8";
    case FrameError::kIncomplete:   return "incomplete frame";
    case FrameError::kEndOfStream:  return "end of stream";
    case FrameError::kIoError:      return "I/O error";
    case FrameError::kDigestFailed: return "digest failed";
    default:                        return "unknown";
  }
}

// ============================================================================
// FrameHeader
// ============================================================================

struct FrameHeader {
  std::string name;
  uint64_t size = 0;
  Digest checksum{};
};

// ============================================================================
// Byte order and UTF-8 helpers
// ============================================================================

namespace detail {

inline void PutBe16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

inline void PutBe64(std::vector<uint8_t>& out, uint64_t v) {
  for (int32_t shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(v >> shift));
  }
}

inline uint16_t GetBe16(const uint8_t* p) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

inline uint64_t GetBe64(const uint8_t* p) noexcept {
  uint64_t v = 0;
  for (size_t i = 0; i < 8U; ++i) {
    v = (v << 8) | p[i];
  }
  return v;
}

}  // namespace detail

/**
 * @brief Strict UTF-8 check: rejects overlong forms, surrogates and code
 * points above U+10FFFF.
 */
inline bool IsValidUtf8(const uint8_t* s, size_t len) noexcept {
  size_t i = 0;
  while (i < len) {
    uint8_t c = s[i];
    if (c < 0x80U) {
      ++i;
      continue;
    }
    size_t extra;
    uint32_t cp;
    uint32_t min_cp;
    if ((c & 0xE0U) == 0xC0U) {
      extra = 1;
      cp = c & 0x1FU;
      min_cp = 0x80U;
    } else if ((c & 0xF0U) == 0xE0U) {
      extra = 2;
      cp = c & 0x0FU;
      min_cp = 0x800U;
    } else if ((c & 0xF8U) == 0xF0U) {
      extra = 3;
      cp = c & 0x07U;
      min_cp = 0x10000U;
    } else {
      return false;
    }
    if (i + extra >= len) return false;
    for (size_t k = 1; k <= extra; ++k) {
      uint8_t cc = s[i + k];
      if ((cc & 0xC0U) != 0x80U) return false;
      cp = (cp << 6) | (cc & 0x3FU);
    }
    if (cp < min_cp || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
      return false;
    }
    i += extra + 1U;
  }
  return true;
}

inline expected<void, FrameError> ValidateName(const std::string& name) {
  if (name.empty()) {
    return expected<void, FrameError>::error(FrameError::kNameEmpty);
  }
  if (name.size() > kMaxNameLen) {
    return expected<void, FrameError>::error(FrameError::kNameTooLong);
  }
  if (!IsValidUtf8(reinterpret_cast<const uint8_t*>(name.data()),
                   name.size())) {
    return expected<void, FrameError>::error(FrameError::kInvalidUtf8);
  }
  return expected<void, FrameError>::success();
}

// ============================================================================
// Encode
// ============================================================================

/**
 * @brief Serialize name_len, name, size and checksum.
 *
 * The payload is not copied; callers send it right after these bytes.
 */
inline expected<std::vector<uint8_t>, FrameError> EncodeFrameHeader(
    const std::string& name, uint64_t size, const Digest& checksum) {
  auto v = ValidateName(name);
  if (!v.has_value()) {
    return expected<std::vector<uint8_t>, FrameError>::error(v.get_error());
  }
  std::vector<uint8_t> out;
  out.reserve(kHeaderFixedSize + name.size());
  detail::PutBe16(out, static_cast<uint16_t>(name.size()));
  out.insert(out.end(), name.begin(), name.end());
  detail::PutBe64(out, size);
  out.insert(out.end(), checksum.begin(), checksum.end());
  return expected<std::vector<uint8_t>, FrameError>::success(std::move(out));
}

/**
 * @brief Hash @p payload and build the header that must precede it.
 */
inline expected<std::vector<uint8_t>, FrameError> EncodeFrame(
    const std::string& name, const void* payload, size_t len) {
  auto d = HashBytes(payload, len);
  if (!d.has_value()) {
    return expected<std::vector<uint8_t>, FrameError>::error(
        FrameError::kDigestFailed);
  }
  return EncodeFrameHeader(name, static_cast<uint64_t>(len), d.value());
}

// ============================================================================
// Decode
// ============================================================================

inline uint16_t DecodeNameLength(const uint8_t* two_bytes) noexcept {
  return detail::GetBe16(two_bytes);
}

/**
 * @brief Decode the bytes that follow name_len: name, size, checksum.
 *
 * @param data      Start of the name field.
 * @param len       Bytes available at @p data.
 * @param name_len  Value of the already decoded name_len field.
 */
inline expected<FrameHeader, FrameError> DecodeHeaderBody(const uint8_t* data,
                                                          size_t len,
                                                          uint16_t name_len) {
  const size_t need = static_cast<size_t>(name_len) + kSizeFieldSize +
                      kDigestSize;
  if (len < need) {
    return expected<FrameHeader, FrameError>::error(FrameError::kIncomplete);
  }
  if (!IsValidUtf8(data, name_len)) {
    return expected<FrameHeader, FrameError>::error(FrameError::kInvalidUtf8);
  }
  FrameHeader h;
  h.name.assign(reinterpret_cast<const char*>(data), name_len);
  h.size = detail::GetBe64(data + name_len);
  std::memcpy(h.checksum.data(), data + name_len + kSizeFieldSize,
              kDigestSize);
  return expected<FrameHeader, FrameError>::success(std::move(h));
}

/**
 * @brief Decode a complete header from a contiguous buffer.
 * @param[out] consumed Header length in bytes on success.
 */
inline expected<FrameHeader, FrameError> DecodeHeader(const uint8_t* data,
                                                      size_t len,
                                                      size_t& consumed) {
  if (len < kNameLenFieldSize) {
    return expected<FrameHeader, FrameError>::error(FrameError::kIncomplete);
  }
  const uint16_t name_len = DecodeNameLength(data);
  auto r = DecodeHeaderBody(data + kNameLenFieldSize, len - kNameLenFieldSize,
                            name_len);
  if (r.has_value()) {
    consumed = kHeaderFixedSize + name_len;
  }
  return r;
}

/**
 * @brief Read one header from a stream socket.
 *
 * kEndOfStream: the peer closed before the first byte of a new header.
 * kIncomplete:  the peer closed somewhere inside the header.
 */
inline expected<FrameHeader, FrameError> ReadFrameHeader(TcpSocket& sock) {
  uint8_t len_buf[kNameLenFieldSize];
  auto r = sock.RecvAll(len_buf, sizeof(len_buf));
  if (!r.has_value()) {
    return expected<FrameHeader, FrameError>::error(
        r.get_error() == SocketError::kClosed ? FrameError::kIncomplete
                                              : FrameError::kIoError);
  }
  if (r.value() == 0U) {
    return expected<FrameHeader, FrameError>::error(FrameError::kEndOfStream);
  }
  if (r.value() < sizeof(len_buf)) {
    return expected<FrameHeader, FrameError>::error(FrameError::kIncomplete);
  }

  const uint16_t name_len = DecodeNameLength(len_buf);
  std::vector<uint8_t> body(static_cast<size_t>(name_len) + kSizeFieldSize +
                            kDigestSize);
  auto b = sock.RecvAll(body.data(), body.size());
  if (!b.has_value()) {
    return expected<FrameHeader, FrameError>::error(
        b.get_error() == SocketError::kClosed ? FrameError::kIncomplete
                                              : FrameError::kIoError);
  }
  if (b.value() < body.size()) {
    return expected<FrameHeader, FrameError>::error(FrameError::kIncomplete);
  }
  return DecodeHeaderBody(body.data(), body.size(), name_len);
}

}  // namespace ferry

#endif  // FERRY_FRAME_HPP_
