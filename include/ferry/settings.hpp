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
 * @file settings.hpp
 * @brief Process settings for ferry_sender and ferry_receiver.
 *
 * Defaults < INI file (--config, or the default file name) < command line.
 */

#ifndef FERRY_SETTINGS_HPP_
#define FERRY_SETTINGS_HPP_

#include "ferry/config.hpp"
#include "ferry/dispatcher.hpp"
#include "ferry/log.hpp"
#include "ferry/receiver.hpp"
#include "ferry/sender.hpp"
#include "ferry/vocabulary.hpp"
#include "ferry/watcher.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

constexpr const char* kDefaultSenderConfig = "ferry_sender.ini";
constexpr const char* kDefaultReceiverConfig = "ferry_receiver.ini";
constexpr uint16_t kDefaultPort = 5001;

struct SenderSettings {
  std::string watch_dir = "/origen";
  std::vector<Destination> destinations = {{"10.0.0.2", kDefaultPort}};
  SenderOptions sender;
  uint32_t settle_delay_ms = 1;
  uint32_t result_timeout_ms = 10000;
  uint32_t max_pending = 1024;
  log::Level log_level = log::GetLevel();

  DispatcherOptions ToDispatcherOptions() const {
    DispatcherOptions o;
    o.sender = sender;
    o.result_timeout_ms = result_timeout_ms;
    o.max_pending = max_pending;
    return o;
  }

  WatchOptions ToWatchOptions() const {
    WatchOptions o;
    o.settle_delay_ms = settle_delay_ms;
    return o;
  }
};

struct ReceiverSettings {
  std::string bind = "0.0.0.0";
  uint16_t port = kDefaultPort;
  std::string dest_dir = "/destino";
  uint32_t chunk_size = 1U << 20;
  int32_t backlog = kDefaultBacklog;
  log::Level log_level = log::GetLevel();

  ReceiverOptions ToReceiverOptions() const {
    ReceiverOptions o;
    o.dest_dir = dest_dir;
    o.chunk_size = chunk_size;
    return o;
  }
};

// ============================================================================
// Helpers
// ============================================================================

/// Comma separated "host:port" list. Empty items are skipped.
inline expected<std::vector<Destination>, ConfigError> ParseDestinationList(
    const std::string& text) {
  std::vector<Destination> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    const std::string item = text.substr(start, comma - start);
    if (item.find_first_not_of(" \t") != std::string::npos) {
      auto d = ParseDestination(item);
      if (!d.has_value()) {
        FERRY_LOG_ERROR("Config", "Bad destination '%s'", item.c_str());
        return expected<std::vector<Destination>, ConfigError>::error(
            d.get_error());
      }
      out.push_back(d.value());
    }
    start = comma + 1U;
  }
  if (out.empty()) {
    return expected<std::vector<Destination>, ConfigError>::error(
        ConfigError::kMissingValue);
  }
  return expected<std::vector<Destination>, ConfigError>::success(
      std::move(out));
}

/// Scan argv for "--config <path>" and return the path, or nullptr.
inline const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

namespace detail {

/// Overwrite @p out when @p key is present; reject malformed or
/// out-of-range values.
inline expected<void, ConfigError> ReadUnsigned(const ConfigStore& cfg,
                                                const char* section,
                                                const char* key,
                                                uint64_t max_val,
                                                uint32_t& out) {
  if (!cfg.HasKey(section, key)) return expected<void, ConfigError>::success();
  auto v = cfg.FindUnsigned(section, key);
  if (!v.has_value() || v.value() > max_val) {
    FERRY_LOG_ERROR("Config", "Invalid %s.%s = '%s'", section, key,
                    cfg.GetString(section, key));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  out = static_cast<uint32_t>(v.value());
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ReadLogLevel(const ConfigStore& cfg,
                                                log::Level& out) {
  if (!cfg.HasKey("log", "level")) return expected<void, ConfigError>::success();
  if (!log::ParseLevel(cfg.GetString("log", "level"), out)) {
    FERRY_LOG_ERROR("Config", "Invalid log.level = '%s'",
                    cfg.GetString("log", "level"));
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ParseArgUnsigned(const char* flag,
                                                    const char* text,
                                                    uint64_t max_val,
                                                    uint64_t& out) {
  auto v = ConfigStore::ParseUnsigned(text);
  if (!v.has_value() || v.value() > max_val) {
    FERRY_LOG_ERROR("Config", "Invalid value for %s: '%s'", flag, text);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  out = v.value();
  return expected<void, ConfigError>::success();
}

/// Load @p path into @p ini. A missing file is not an error.
inline expected<void, ConfigError> LoadIni(const char* path, IniConfig& ini) {
  auto r = ini.LoadFile(path);
  if (!r.has_value()) {
    if (r.get_error() == ConfigError::kFileNotFound) {
      FERRY_LOG_WARN("Config", "Cannot load '%s', using defaults", path);
      return expected<void, ConfigError>::success();
    }
    FERRY_LOG_ERROR("Config", "Parse error in '%s' at line %d", path,
                    ini.ErrorLine());
    return r;
  }
  FERRY_LOG_INFO("Config", "Loaded configuration from '%s'", path);
  return r;
}

}  // namespace detail

#define FERRY_TRY_CONFIG(expr)          \
  do {                                  \
    auto ferry_try_r_ = (expr);         \
    if (!ferry_try_r_.has_value())      \
      return ferry_try_r_;              \
  } while (0)

// ============================================================================
// Sender
// ============================================================================

inline expected<void, ConfigError> ApplySenderConfig(const ConfigStore& cfg,
                                                     SenderSettings& s) {
  s.watch_dir = cfg.GetString("sender", "watch_dir", s.watch_dir.c_str());
  if (cfg.HasKey("sender", "destinations")) {
    auto list = ParseDestinationList(cfg.GetString("sender", "destinations"));
    if (!list.has_value()) {
      return expected<void, ConfigError>::error(list.get_error());
    }
    s.destinations = std::move(list.value());
  }
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "backoff_ms",
                                        UINT32_MAX, s.sender.backoff_ms));
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "connect_timeout_ms",
                                        UINT32_MAX,
                                        s.sender.connect_timeout_ms));
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "ack_timeout_ms",
                                        UINT32_MAX, s.sender.ack_timeout_ms));
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "settle_delay_ms",
                                        UINT32_MAX, s.settle_delay_ms));
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "result_timeout_ms",
                                        UINT32_MAX, s.result_timeout_ms));
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "sender", "max_pending",
                                        UINT32_MAX, s.max_pending));
  FERRY_TRY_CONFIG(detail::ReadLogLevel(cfg, s.log_level));
  return expected<void, ConfigError>::success();
}

/**
 * @brief Apply command-line overrides. "--dest" may repeat; the first one
 * replaces the configured list.
 */
inline expected<void, ConfigError> ApplySenderArgs(int argc, char* argv[],
                                                   SenderSettings& s) {
  bool dest_seen = false;
  for (int i = 1; i < argc; ++i) {
    const char* flag = argv[i];
    if (i + 1 >= argc) {
      FERRY_LOG_ERROR("Config", "Missing value for %s", flag);
      return expected<void, ConfigError>::error(ConfigError::kMissingValue);
    }
    const char* val = argv[++i];
    if (std::strcmp(flag, "--config") == 0) {
      continue;
    } else if (std::strcmp(flag, "--watch") == 0) {
      s.watch_dir = val;
    } else if (std::strcmp(flag, "--dest") == 0) {
      auto d = ParseDestination(val);
      if (!d.has_value()) {
        FERRY_LOG_ERROR("Config", "Bad destination '%s'", val);
        return expected<void, ConfigError>::error(d.get_error());
      }
      if (!dest_seen) s.destinations.clear();
      dest_seen = true;
      s.destinations.push_back(d.value());
    } else if (std::strcmp(flag, "--log-level") == 0) {
      if (!log::ParseLevel(val, s.log_level)) {
        FERRY_LOG_ERROR("Config", "Invalid log level '%s'", val);
        return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
      }
    } else {
      FERRY_LOG_ERROR("Config", "Unknown option %s", flag);
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
  }
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> LoadSenderSettings(int argc, char* argv[],
                                                      SenderSettings& s) {
  const char* path = FindConfigArg(argc, argv);
  IniConfig ini;
  FERRY_TRY_CONFIG(detail::LoadIni(path ? path : kDefaultSenderConfig, ini));
  FERRY_TRY_CONFIG(ApplySenderConfig(ini, s));
  FERRY_TRY_CONFIG(ApplySenderArgs(argc, argv, s));
  if (s.destinations.empty() || s.watch_dir.empty()) {
    FERRY_LOG_ERROR("Config", "A watch directory and a destination are required");
    return expected<void, ConfigError>::error(ConfigError::kMissingValue);
  }
  return expected<void, ConfigError>::success();
}

// ============================================================================
// Receiver
// ============================================================================

inline expected<void, ConfigError> ApplyReceiverConfig(const ConfigStore& cfg,
                                                       ReceiverSettings& s) {
  s.bind = cfg.GetString("receiver", "bind", s.bind.c_str());
  s.dest_dir = cfg.GetString("receiver", "dest_dir", s.dest_dir.c_str());
  uint32_t port = s.port;
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "receiver", "port", 65535U, port));
  s.port = static_cast<uint16_t>(port);
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "receiver", "chunk_size",
                                        UINT32_MAX, s.chunk_size));
  uint32_t backlog = static_cast<uint32_t>(s.backlog);
  FERRY_TRY_CONFIG(detail::ReadUnsigned(cfg, "receiver", "backlog", 65535U,
                                        backlog));
  s.backlog = static_cast<int32_t>(backlog);
  FERRY_TRY_CONFIG(detail::ReadLogLevel(cfg, s.log_level));
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> ApplyReceiverArgs(int argc, char* argv[],
                                                     ReceiverSettings& s) {
  for (int i = 1; i < argc; ++i) {
    const char* flag = argv[i];
    if (i + 1 >= argc) {
      FERRY_LOG_ERROR("Config", "Missing value for %s", flag);
      return expected<void, ConfigError>::error(ConfigError::kMissingValue);
    }
    const char* val = argv[++i];
    if (std::strcmp(flag, "--config") == 0) {
      continue;
    } else if (std::strcmp(flag, "--bind") == 0) {
      s.bind = val;
    } else if (std::strcmp(flag, "--port") == 0) {
      uint64_t port = 0;
      FERRY_TRY_CONFIG(detail::ParseArgUnsigned(flag, val, 65535U, port));
      s.port = static_cast<uint16_t>(port);
    } else if (std::strcmp(flag, "--dest-dir") == 0) {
      s.dest_dir = val;
    } else if (std::strcmp(flag, "--log-level") == 0) {
      if (!log::ParseLevel(val, s.log_level)) {
        FERRY_LOG_ERROR("Config", "Invalid log level '%s'", val);
        return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
      }
    } else {
      FERRY_LOG_ERROR("Config", "Unknown option %s", flag);
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
  }
  return expected<void, ConfigError>::success();
}

inline expected<void, ConfigError> LoadReceiverSettings(int argc, char* argv[],
                                                        ReceiverSettings& s) {
  const char* path = FindConfigArg(argc, argv);
  IniConfig ini;
  FERRY_TRY_CONFIG(detail::LoadIni(path ? path : kDefaultReceiverConfig, ini));
  FERRY_TRY_CONFIG(ApplyReceiverConfig(ini, s));
  FERRY_TRY_CONFIG(ApplyReceiverArgs(argc, argv, s));
  if (s.chunk_size == 0U) {
    FERRY_LOG_ERROR("Config", "chunk_size must be positive");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (s.dest_dir.empty()) {
    return expected<void, ConfigError>::error(ConfigError::kMissingValue);
  }
  return expected<void, ConfigError>::success();
}

}  // namespace ferry

#endif  // FERRY_SETTINGS_HPP_
