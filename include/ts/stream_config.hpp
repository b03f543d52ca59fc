/**
 * @file stream_config.hpp
 * @brief Session configuration and the URL / option builders that turn it
 *        into an engine launch description.
 */

#ifndef TS_STREAM_CONFIG_HPP_
#define TS_STREAM_CONFIG_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace ts {

// ============================================================================
// Defaults
// ============================================================================

static constexpr uint16_t kDefaultUdpPort = 8600U;
static constexpr uint16_t kDefaultCameraRtspPort = 554U;
static constexpr uint16_t kDefaultSinkPort = 8554U;
static constexpr uint32_t kNetworkCachingMs = 1000U;
static constexpr uint32_t kLiveCachingMs = 500U;

// ============================================================================
// StreamConfig
// ============================================================================

enum class IngestMode : uint8_t {
  kUdpPush = 0,  ///< Camera pushes raw UDP to our listen port.
  kRtspPull      ///< We pull RTSP from the camera.
};

inline const char* IngestModeName(IngestMode mode) noexcept {
  return mode == IngestMode::kRtspPull ? "rtsp" : "udp";
}

/// @brief Immutable for the lifetime of a session.
struct StreamConfig {
  IngestMode mode = IngestMode::kUdpPush;
  uint16_t udp_port = kDefaultUdpPort;

  std::string camera_host;
  uint16_t camera_port = kDefaultCameraRtspPort;
  std::string camera_path;
  std::string username;
  std::string password;

  uint16_t sink_port = kDefaultSinkPort;
  std::string token;  ///< Empty disables URL token protection.
};

/**
 * @brief Reject configurations no engine could start from.
 * @return kInvalidConfig for a zero port or an RTSP pull without a host.
 */
inline expected<void, SessionError> ValidateStreamConfig(
    const StreamConfig& cfg) {
  if (cfg.sink_port == 0U) {
    return expected<void, SessionError>::error(SessionError::kInvalidConfig);
  }
  if (cfg.mode == IngestMode::kUdpPush && cfg.udp_port == 0U) {
    return expected<void, SessionError>::error(SessionError::kInvalidConfig);
  }
  if (cfg.mode == IngestMode::kRtspPull &&
      (cfg.camera_host.empty() || cfg.camera_port == 0U)) {
    return expected<void, SessionError>::error(SessionError::kInvalidConfig);
  }
  return expected<void, SessionError>::success();
}

// ============================================================================
// URL Builders
// ============================================================================

/// @brief RFC 3986 userinfo encoding: unreserved characters pass through.
inline std::string PercentEncode(const std::string& in) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '.' ||
                            c == '_' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

namespace detail {

inline std::string BuildRtspPullUrl(const StreamConfig& cfg,
                                    bool with_credentials) {
  std::string url = "rtsp://";
  if (with_credentials && !cfg.username.empty()) {
    url += PercentEncode(cfg.username);
    if (!cfg.password.empty()) {
      url += ':';
      url += PercentEncode(cfg.password);
    }
    url += '@';
  }
  url += cfg.camera_host;
  url += ':';
  url += std::to_string(cfg.camera_port);
  if (!cfg.camera_path.empty()) {
    if (cfg.camera_path.front() != '/') {
      url += '/';
    }
    url += cfg.camera_path;
  }
  return url;
}

}  // namespace detail

/**
 * @brief Engine source locator.
 *
 * "udp://@:PORT" for push, "rtsp://[user[:pass]@]host:port/path" for pull.
 */
inline std::string BuildIngestUrl(const StreamConfig& cfg) {
  if (cfg.mode == IngestMode::kUdpPush) {
    return "udp://@:" + std::to_string(cfg.udp_port);
  }
  return detail::BuildRtspPullUrl(cfg, true);
}

/// @brief Same as BuildIngestUrl() but never carries credentials (for logs).
inline std::string BuildDisplayIngestUrl(const StreamConfig& cfg) {
  if (cfg.mode == IngestMode::kUdpPush) {
    return BuildIngestUrl(cfg);
  }
  return detail::BuildRtspPullUrl(cfg, false);
}

/// @brief "/stream-<token>", or "/stream" when the token is blank.
inline std::string BuildSinkPath(const std::string& token) {
  bool blank = true;
  for (char c : token) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      blank = false;
      break;
    }
  }
  return blank ? std::string("/stream") : "/stream-" + token;
}

/// @brief Output spec: "#rtp{sdp=rtsp://0.0.0.0:PORT<path>}".
inline std::string BuildSinkSpec(const StreamConfig& cfg) {
  return "#rtp{sdp=rtsp://0.0.0.0:" + std::to_string(cfg.sink_port) +
         BuildSinkPath(cfg.token) + "}";
}

/// @brief URL viewers connect to: "rtsp://<address>:PORT<path>".
inline std::string BuildPublishedUrl(const std::string& address,
                                     const StreamConfig& cfg) {
  return "rtsp://" + address + ":" + std::to_string(cfg.sink_port) +
         BuildSinkPath(cfg.token);
}

// ============================================================================
// EngineLaunchSpec
// ============================================================================

/// @brief Everything a media engine needs to open one session.
struct EngineLaunchSpec {
  std::string source_url;
  std::string sink_spec;
  std::vector<std::string> engine_options;  ///< Global ("--name=value").
  std::vector<std::string> media_options;   ///< Per-input (":name=value").
  bool pulled_source = false;
};

/**
 * @brief Tuning options for the engine.
 *
 * Pull sources use RTSP-over-TCP with a 10 s input timeout; push sources a
 * 10 s UDP inactivity timeout. The served side never times out.
 */
inline std::vector<std::string> BuildEngineOptions(const StreamConfig& cfg) {
  std::vector<std::string> opts;
  opts.push_back("--network-caching=" + std::to_string(kNetworkCachingMs));
  opts.push_back("--live-caching=" + std::to_string(kLiveCachingMs));
  if (cfg.mode == IngestMode::kRtspPull) {
    opts.emplace_back("--rtsp-tcp");
    opts.emplace_back("--rtsp-timeout=10");
  } else {
    opts.emplace_back("--udp-timeout=10000");
  }
  opts.emplace_back("--rtsp-timeout=0");
  return opts;
}

inline EngineLaunchSpec BuildLaunchSpec(const StreamConfig& cfg) {
  EngineLaunchSpec spec;
  spec.source_url = BuildIngestUrl(cfg);
  spec.sink_spec = BuildSinkSpec(cfg);
  spec.engine_options = BuildEngineOptions(cfg);
  spec.media_options.push_back(":sout=" + spec.sink_spec);
  spec.media_options.emplace_back(":sout-keep");
  spec.media_options.push_back(":network-caching=" +
                               std::to_string(kNetworkCachingMs));
  spec.pulled_source = cfg.mode == IngestMode::kRtspPull;
  return spec;
}

}  // namespace ts

#endif  // TS_STREAM_CONFIG_HPP_
