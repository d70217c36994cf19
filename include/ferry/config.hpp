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
 * @file config.hpp
 * @brief INI configuration store backed by inih.
 *
 * Entries are kept flat as (section, key, value); lookups are
 * case-insensitive on section and key. A key repeated in the same section
 * keeps its last value.
 *
 * Usage:
 * @code
 *   ferry::IniConfig cfg;
 *   auto r = cfg.LoadFile("ferry_receiver.ini");
 *   uint16_t port = cfg.GetPort("receiver", "port", 5001);
 * @endcode
 */

#ifndef FERRY_CONFIG_HPP_
#define FERRY_CONFIG_HPP_

#include "ferry/platform.hpp"
#include "ferry/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <ini.h>

namespace ferry {

// ============================================================================
// ConfigStore - flat section/key/value storage
// ============================================================================

class ConfigStore {
 public:
  // --- Typed getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return default_val;
    if (val < 0) return 0;
    if (val > 65535) return 65535;
    return static_cast<uint16_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  // --- Optional getters ---

  std::optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  std::optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    return ParseBool(e->value.c_str());
  }

  /**
   * @brief Strictly parsed unsigned value.
   * @return kMissingValue if absent, kInvalidValue if the whole value is not
   *         a non-negative decimal number.
   */
  expected<uint64_t, ConfigError> FindUnsigned(const char* section,
                                               const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<uint64_t, ConfigError>::error(ConfigError::kMissingValue);
    }
    return ParseUnsigned(e->value.c_str());
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    FERRY_ASSERT(section != nullptr);
    for (const auto& e : entries_) {
      if (StrCaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// Insert or overwrite one entry.
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

  static expected<uint64_t, ConfigError> ParseUnsigned(const char* text) {
    if (text == nullptr || *text < '0' || *text > '9') {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long val = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0') {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint64_t, ConfigError>::success(static_cast<uint64_t>(val));
  }

 protected:
  static constexpr uint32_t kMaxEntries = 256;

  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (auto& e : entries_) {
      if (StrCaseEqual(e.section.c_str(), section) &&
          StrCaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return true;
      }
    }
    if (entries_.size() >= kMaxEntries) return false;
    entries_.push_back({section, key, value});
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    FERRY_ASSERT(section != nullptr && key != nullptr);
    for (const auto& e : entries_) {
      if (StrCaseEqual(e.section.c_str(), section) &&
          StrCaseEqual(e.key.c_str(), key))
        return &e;
    }
    return nullptr;
  }

  static bool StrCaseEqual(const char* a, const char* b) noexcept {
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
      if (la != lb) return false;
      ++a; ++b;
    }
    return *a == *b;
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return StrCaseEqual(str, "true") || StrCaseEqual(str, "1") ||
           StrCaseEqual(str, "yes") || StrCaseEqual(str, "on");
  }
};

// ============================================================================
// IniConfig - inih front end
// ============================================================================

class IniConfig final : public ConfigStore {
 public:
  IniConfig() = default;

  /**
   * @brief Parse an INI file, merging into the current entries.
   * @return kFileNotFound if the file cannot be opened, kParseError with the
   *         first bad line otherwise available through ErrorLine().
   */
  expected<void, ConfigError> LoadFile(const char* path) {
    FERRY_ASSERT(path != nullptr);
    int result = ini_parse(path, &IniConfig::Handler, this);
    return Check(result);
  }

  expected<void, ConfigError> LoadBuffer(const char* data) {
    FERRY_ASSERT(data != nullptr);
    int result = ini_parse_string(data, &IniConfig::Handler, this);
    return Check(result);
  }

  /// Line number of the last parse error, 0 if none.
  int32_t ErrorLine() const noexcept { return error_line_; }

 private:
  expected<void, ConfigError> Check(int result) {
    error_line_ = (result > 0) ? result : 0;
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result == -2 || full_) {
      full_ = false;
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* self = static_cast<IniConfig*>(user);
    if (!self->AddEntry(section ? section : "", name ? name : "",
                        value ? value : "")) {
      self->full_ = true;
      return 0;
    }
    return 1;
  }

  int32_t error_line_ = 0;
  bool full_ = false;
};

}  // namespace ferry

#endif  // FERRY_CONFIG_HPP_
