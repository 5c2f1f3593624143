/**
 * @file config.hpp
 * @brief INI configuration (inih) for the bridge server and client.
 *
 * Layout:
 * @code
 *   [server]
 *   host = 0.0.0.0
 *   port = 28900
 *   poll_ms = 300
 *
 *   [client]
 *   host = 192.168.0.100
 *   port = 28900
 *   auto_connect = false
 *   connect_timeout_ms = 5000
 *
 *   [log]
 *   level = info
 * @endcode
 * Section and key lookups are case-insensitive. Missing keys keep the
 * defaults already in the target struct.
 */

#ifndef CLIPSYNC_CONFIG_HPP_
#define CLIPSYNC_CONFIG_HPP_

#include "clipsync/bridge_server.hpp"
#include "clipsync/clip_client.hpp"
#include "clipsync/log.hpp"
#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <utility>

#include <ini.h>

namespace clipsync {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kInvalidValue
};

inline const char* ConfigErrorToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError:   return "parse error";
    case ConfigError::kInvalidValue: return "invalid value";
    default:                         return "unknown";
  }
}

// ============================================================================
// ConfigStore - flat section/key storage
// ============================================================================

class ConfigStore {
 public:
  /**
   * @brief Parse an INI file; later keys override earlier ones.
   * @return kFileNotFound if unreadable, kParseError with the first bad
   *         line recorded in ErrorLine().
   */
  expected<void, ConfigError> LoadFile(const char* path) {
    CLIPSYNC_ASSERT(path != nullptr);
    int result = ini_parse(path, &ConfigStore::Handler, this);
    return Finish(result);
  }

  expected<void, ConfigError> LoadBuffer(const char* data) {
    CLIPSYNC_ASSERT(data != nullptr);
    int result = ini_parse_string(data, &ConfigStore::Handler, this);
    return Finish(result);
  }

  // --- Typed Getters ---

  std::string GetString(const char* section, const char* key,
                        const std::string& default_val = std::string()) const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.value_or(default_val);
  }

  /** @brief Port number; out-of-range or malformed values give the default. */
  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    if (!v.has_value() || v.value() < 0 || v.value() > 65535) {
      return default_val;
    }
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    optional<bool> v = FindBool(section, key);
    return v.value_or(default_val);
  }

  // --- Optional Getters ---

  /** @brief Whole-string decimal integer; trailing junk is rejected. */
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr || v->empty()) return {};
    char* end = nullptr;
    long val = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return {};
    if (val < INT32_MIN || val > INT32_MAX) return {};
    return optional<int32_t>{static_cast<int32_t>(val)};
  }

  /** @brief true/false, yes/no, on/off, 1/0. Anything else is absent. */
  optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return {};
    const char* s = v->c_str();
    if (StrCaseEqual(s, "true") || StrCaseEqual(s, "yes") ||
        StrCaseEqual(s, "on") || std::string(s) == "1") {
      return optional<bool>{true};
    }
    if (StrCaseEqual(s, "false") || StrCaseEqual(s, "no") ||
        StrCaseEqual(s, "off") || std::string(s) == "0") {
      return optional<bool>{false};
    }
    return {};
  }

  // --- Query ---

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /** @brief Set or override one value (used for CLI overrides and tests). */
  void Set(const char* section, const char* key, const std::string& value) {
    entries_[MakeKey(section, key)] = value;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  /** @brief Line number of the first parse error, 0 if none. */
  int ErrorLine() const noexcept { return error_line_; }

 private:
  using Key = std::pair<std::string, std::string>;

  static bool StrCaseEqual(const char* a, const char* b) noexcept {
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
      if (la != lb) return false;
      ++a; ++b;
    }
    return *a == *b;
  }

  static std::string Lower(const char* s) {
    std::string out(s != nullptr ? s : "");
    for (auto& c : out) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
    }
    return out;
  }

  static Key MakeKey(const char* section, const char* key) {
    return Key(Lower(section), Lower(key));
  }

  const std::string* FindEntry(const char* section, const char* key) const {
    CLIPSYNC_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(MakeKey(section, key));
    return (it == entries_.end()) ? nullptr : &it->second;
  }

  expected<void, ConfigError> Finish(int result) {
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      error_line_ = result;
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* self = static_cast<ConfigStore*>(user);
    self->entries_[MakeKey(section, name)] = (value != nullptr) ? value : "";
    return 1;
  }

  std::map<Key, std::string> entries_;
  int error_line_ = 0;
};

// ============================================================================
// Overlay helpers
// ============================================================================

namespace detail {

inline bool OverlayPort(const ConfigStore& store, const char* section,
                        uint16_t& port) {
  if (!store.HasKey(section, "port")) return true;
  optional<int32_t> v = store.FindInt(section, "port");
  if (!v.has_value() || v.value() < 0 || v.value() > 65535) {
    CLIPSYNC_LOG_ERROR("Main", "[%s] port must be 0..65535", section);
    return false;
  }
  port = static_cast<uint16_t>(v.value());
  return true;
}

inline bool OverlayMs(const ConfigStore& store, const char* section,
                      const char* key, uint32_t& out) {
  if (!store.HasKey(section, key)) return true;
  optional<int32_t> v = store.FindInt(section, key);
  if (!v.has_value() || v.value() < 0) {
    CLIPSYNC_LOG_ERROR("Main", "[%s] %s must be a non-negative integer",
                       section, key);
    return false;
  }
  out = static_cast<uint32_t>(v.value());
  return true;
}

}  // namespace detail

/** @brief Apply [server] keys on top of @p cfg. */
inline expected<void, ConfigError> LoadServerConfig(const ConfigStore& store,
                                                    ServerConfig& cfg) {
  cfg.host = store.GetString("server", "host", cfg.host);
  if (!detail::OverlayPort(store, "server", cfg.port) ||
      !detail::OverlayMs(store, "server", "poll_ms", cfg.poll_interval_ms)) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

/** @brief Apply [client] keys on top of @p cfg. */
inline expected<void, ConfigError> LoadClientConfig(const ConfigStore& store,
                                                    ClientConfig& cfg) {
  cfg.host = store.GetString("client", "host", cfg.host);
  if (store.HasKey("client", "auto_connect")) {
    optional<bool> v = store.FindBool("client", "auto_connect");
    if (!v.has_value()) {
      CLIPSYNC_LOG_ERROR("Main", "[client] auto_connect must be a boolean");
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    cfg.auto_reconnect = v.value();
  }
  if (!detail::OverlayPort(store, "client", cfg.port) ||
      !detail::OverlayMs(store, "client", "connect_timeout_ms",
                         cfg.connect_timeout_ms)) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

/** @brief Apply [log] level, if present. */
inline expected<void, ConfigError> LoadLogConfig(const ConfigStore& store) {
  if (!store.HasKey("log", "level")) {
    return expected<void, ConfigError>::success();
  }
  log::Level level;
  if (!log::ParseLevel(store.GetString("log", "level").c_str(), level)) {
    CLIPSYNC_LOG_ERROR("Main", "[log] level is not a known level");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  log::SetLevel(level);
  return expected<void, ConfigError>::success();
}

}  // namespace clipsync

#endif  // CLIPSYNC_CONFIG_HPP_
