/**
 * @file config.hpp
 * @brief Flat "section + key = value" configuration store with file
 *        backends selected at compile time.
 *
 * Backends (CMake opt-in):
 *   - IniBackend  : inih library   (TS_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (TS_CONFIG_JSON_ENABLED)
 *
 * JSON objects nest one level: {"sink": {"port": 8554}} becomes
 * sink.port = "8554". Command-line overrides go through Set() or
 * ApplyOverride("section.key=value") after the file is loaded.
 *
 * Usage:
 * @code
 *   ts::MultiConfig cfg;
 *   cfg.LoadFile("tetherstream.ini");
 *   cfg.ApplyOverride("sink.port=9554");
 *   uint16_t port = cfg.GetPort("sink", "port", 8554);
 * @endcode
 */

#ifndef TS_CONFIG_HPP_
#define TS_CONFIG_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>

#ifdef TS_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef TS_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

namespace ts {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef TS_CONFIG_MAX_FILE_SIZE
#define TS_CONFIG_MAX_FILE_SIZE 8192U
#endif

class ConfigStore {
 public:
  // --- Typed getters (default when missing or unparsable) ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? default_val : static_cast<int32_t>(val);
  }

  uint16_t GetPort(const char* section, const char* key,
                   uint16_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return default_val;
    if (val < 0) return 0;
    if (val > 65535) return 65535;
    return static_cast<uint16_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  // --- Checked getter ---

  /**
   * @brief Whole-number value within [min_val, max_val].
   * @return @p default_val when the key is absent, kInvalidValue when the
   *         text is not a plain decimal number or is out of range.
   */
  expected<uint32_t, ConfigError> GetUintInRange(const char* section,
                                                 const char* key,
                                                 uint32_t default_val,
                                                 uint32_t min_val,
                                                 uint32_t max_val) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<uint32_t, ConfigError>::success(default_val);
    }
    const char* p = e->value;
    while (*p == ' ') ++p;
    if (*p < '0' || *p > '9') {
      return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    char* end = nullptr;
    unsigned long long val = std::strtoull(p, &end, 10);
    while (*end == ' ') ++end;
    if (*end != '\0' || val < min_val || val > max_val) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(val));
  }

  // --- Optional getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    return (end == e->value) ? optional<int32_t>{}
                             : optional<int32_t>{static_cast<int32_t>(val)};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{}
                          : optional<bool>{ParseBool(e->value)};
  }

  // --- Mutation ---

  /// @return false when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    TS_ASSERT(section != nullptr && key != nullptr);
    return AddEntry(section, key, value);
  }

  /**
   * @brief Apply "section.key=value". The value may be empty; the section
   *        and key may not.
   * @return kParseError for malformed text, kBufferFull when full.
   */
  expected<void, ConfigError> ApplyOverride(const char* assignment) {
    if (assignment == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const char* eq = std::strchr(assignment, '=');
    if (eq == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const std::string lhs(assignment, static_cast<size_t>(eq - assignment));
    const size_t dot = lhs.find('.');
    if (dot == std::string::npos || dot == 0U || dot + 1U >= lhs.size() ||
        lhs.size() >= kMaxKeyLen * 2U) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const std::string section = lhs.substr(0, dot);
    const std::string key = lhs.substr(dot + 1U);
    if (!AddEntry(section.c_str(), key.c_str(), eq + 1)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    TS_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  /// Later writes to the same section/key replace the value.
  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(
      const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (bytes == buf_size - 1U) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    TS_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::StrCaseEqual(str, "true") ||
           detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend not compiled in.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef TS_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    int result = ini_parse_string(data, Handler, &store);
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef TS_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[TS_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          char val[ConfigStore::kMaxValueLen];
          ToStr(*kit, val, sizeof(val));
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(), val)) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else {
        char val[ConfigStore::kMaxValueLen];
        ToStr(*it, val, sizeof(val));
        if (!store.AddEntry("", it.key().c_str(), val)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static void ToStr(const nlohmann::json& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_unsigned()) {
      std::snprintf(b, sz, "%llu",
                    static_cast<unsigned long long>(n.get<uint64_t>()));
    } else if (n.is_number_integer()) {
      std::snprintf(b, sz, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      std::snprintf(b, sz, "%g", n.get<double>());
    } else {
      auto s = n.dump();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    }
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    TS_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    TS_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Aliases
// ============================================================================

#if defined(TS_CONFIG_INI_ENABLED) || defined(TS_CONFIG_JSON_ENABLED)
#define TS_CONFIG_HAS_FILE_BACKEND 1

using MultiConfig = Config<
#ifdef TS_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(TS_CONFIG_INI_ENABLED) && defined(TS_CONFIG_JSON_ENABLED)
    ,
#endif
#ifdef TS_CONFIG_JSON_ENABLED
    JsonBackend
#endif
    >;
#else
#define TS_CONFIG_HAS_FILE_BACKEND 0
#endif

#ifdef TS_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef TS_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif

}  // namespace ts

#endif  // TS_CONFIG_HPP_
