/**
 * @file tethering.hpp
 * @brief Ethernet tethering state: a capability interface over the OS query
 *        plus the monitor that filters its answer down to wired tethering.
 */

#ifndef TS_TETHERING_HPP_
#define TS_TETHERING_HPP_

#include "ts/interface_inspector.hpp"
#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <dirent.h>

#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

namespace ts {

// ============================================================================
// TetherStateSource
// ============================================================================

enum class TetherQueryError : uint8_t {
  kUnavailable = 0,  ///< The platform query is not supported here.
  kReadFailed
};

/**
 * @brief Supplies the names of interfaces currently acting as tethering
 *        links. One adapter per platform plus an in-memory one for tests.
 */
class TetherStateSource {
 public:
  virtual ~TetherStateSource() = default;

  virtual expected<std::vector<std::string>, TetherQueryError>
  TetheredInterfaces() = 0;
};

// ============================================================================
// SysfsTetherStateSource
// ============================================================================

/**
 * @brief Linux adapter: a link is tethered when its operstate is "up" and
 *        it reports carrier. Wireless links (those with a "wireless" sysfs
 *        node) are skipped.
 */
class SysfsTetherStateSource final : public TetherStateSource {
 public:
  explicit SysfsTetherStateSource(const char* root = "/sys/class/net")
      : root_(root) {}

  expected<std::vector<std::string>, TetherQueryError> TetheredInterfaces()
      override {
    using Result = expected<std::vector<std::string>, TetherQueryError>;
    DIR* dir = ::opendir(root_.c_str());
    if (dir == nullptr) {
      return Result::error(TetherQueryError::kUnavailable);
    }

    std::vector<std::string> names;
    struct dirent* entry = nullptr;
    while ((entry = ::readdir(dir)) != nullptr) {
      if (entry->d_name[0] == '.') continue;
      const std::string base = root_ + "/" + entry->d_name;
      if (PathExists(base + "/wireless")) continue;
      if (ReadFirstLine(base + "/operstate") != "up") continue;
      if (ReadFirstLine(base + "/carrier") != "1") continue;
      names.emplace_back(entry->d_name);
    }
    ::closedir(dir);
    return Result::success(std::move(names));
  }

 private:
  static bool PathExists(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "r");
    if (f != nullptr) {
      (void)std::fclose(f);
      return true;
    }
    DIR* d = ::opendir(path.c_str());
    if (d != nullptr) {
      ::closedir(d);
      return true;
    }
    return false;
  }

  static std::string ReadFirstLine(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "r");
    if (f == nullptr) return {};
    char buf[64] = {0};
    std::string line;
    if (std::fgets(buf, sizeof(buf), f) != nullptr) {
      line = buf;
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
      }
    }
    (void)std::fclose(f);
    return line;
  }

  std::string root_;
};

// ============================================================================
// StaticTetherStateSource
// ============================================================================

/// @brief In-memory adapter for tests and configuration overrides.
class StaticTetherStateSource final : public TetherStateSource {
 public:
  StaticTetherStateSource() = default;

  void SetInterfaces(std::vector<std::string> names) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_ = std::move(names);
    fail_ = false;
  }

  /// @brief Make the next queries fail with @p err.
  void SetFailure(TetherQueryError err) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = true;
    error_ = err;
  }

  expected<std::vector<std::string>, TetherQueryError> TetheredInterfaces()
      override {
    using Result = expected<std::vector<std::string>, TetherQueryError>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_) {
      return Result::error(error_);
    }
    return Result::success(names_);
  }

 private:
  std::mutex mutex_;
  std::vector<std::string> names_;
  bool fail_ = false;
  TetherQueryError error_ = TetherQueryError::kUnavailable;
};

// ============================================================================
// TetheringMonitor
// ============================================================================

/**
 * @brief True when a USB (usb, rndis, ncm), Bluetooth (bt, bnep) or
 *        Wi-Fi (wlan, wl, ap, swlan, p2p) tethering name.
 */
inline bool IsNonEthernetTetherName(const char* name) noexcept {
  static constexpr const char* kExcluded[] = {
      "usb", "rndis", "ncm", "bt", "bnep", "wlan", "wl", "ap", "swlan", "p2p"};
  for (const char* prefix : kExcluded) {
    if (HasPrefixNoCase(name, prefix)) return true;
  }
  return false;
}

/**
 * @brief Answers whether the host is currently tethering over Ethernet.
 *
 * The source is borrowed and must outlive the monitor.
 */
class TetheringMonitor final {
 public:
  explicit TetheringMonitor(TetherStateSource& source) noexcept
      : source_(source) {}

  /**
   * @brief True iff any tethered interface is Ethernet-named.
   *
   * Never fails: a source error is logged and reported as false.
   */
  bool IsEthernetTetheringActive() {
    auto r = source_.TetheredInterfaces();
    if (!r.has_value()) {
      TS_LOG_WARN("Tethering", "tethering state query failed (code %u)",
                  static_cast<unsigned>(r.get_error()));
      return false;
    }
    for (const auto& name : r.value()) {
      if (IsEthernetName(name.c_str()) &&
          !IsNonEthernetTetherName(name.c_str())) {
        TS_LOG_DEBUG("Tethering", "ethernet tethering active on %s",
                     name.c_str());
        return true;
      }
    }
    return false;
  }

 private:
  TetherStateSource& source_;
};

}  // namespace ts

#endif  // TS_TETHERING_HPP_
