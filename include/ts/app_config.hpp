/**
 * @file app_config.hpp
 * @brief Maps a ConfigStore onto the typed option structs of every module.
 *
 * Recognised keys (all optional):
 *
 *   [ingest]      mode (udp|rtsp), udp_port, camera_host, camera_port,
 *                 camera_path, username, password
 *   [sink]        port, token_file
 *   [scan]        start, end, probe_port, timeout_ms, icmp_fallback,
 *                 tcp_backend (posix|sockpp)
 *   [supervisor]  max_reconnect, reconnect_delay_ms, sample_interval_ms,
 *                 notification_interval_ticks
 *   [engine]      program, settle_ms, stop_grace_ms
 *   [log]         level (debug|info|warn|error|off)
 */

#ifndef TS_APP_CONFIG_HPP_
#define TS_APP_CONFIG_HPP_

#include "ts/config.hpp"
#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/process_engine.hpp"
#include "ts/stream_config.hpp"
#include "ts/subnet_scanner.hpp"
#include "ts/supervisor.hpp"
#include "ts/vocabulary.hpp"

#if TS_HAS_NETWORK

#include <string>

namespace ts {

enum class ProbeBackend : uint8_t { kPosix = 0, kSockpp };

struct AppConfig {
  StreamConfig stream;
  std::string token_file = "tetherstream.token";

  ScanOptions scan;
  uint32_t scan_start = kFirstHostId;
  uint32_t scan_end = kLastHostId;
  ProbeBackend probe_backend = ProbeBackend::kPosix;

  SupervisorOptions supervisor;
  ProcessEngineOptions engine;
  log::Level log_level = log::Level::kInfo;
};

namespace detail {

inline bool ReportInvalid(const char* section, const char* key,
                          const ConfigStore& store) {
  TS_LOG_ERROR("Config", "invalid value for %s.%s: '%s'", section, key,
               store.GetString(section, key));
  return false;
}

/// Reads a checked number into @p out; false (logged) when invalid.
template <typename T>
inline bool ReadUint(const ConfigStore& store, const char* section,
                     const char* key, uint32_t min_val, uint32_t max_val,
                     T& out) {
  auto r = store.GetUintInRange(section, key, static_cast<uint32_t>(out),
                                min_val, max_val);
  if (!r.has_value()) return ReportInvalid(section, key, store);
  out = static_cast<T>(r.value());
  return true;
}

}  // namespace detail

/**
 * @brief Build the application configuration from @p store.
 * @return kInvalidValue (after logging the offending key) when any value
 *         is malformed or out of range.
 */
inline expected<AppConfig, ConfigError> LoadAppConfig(const ConfigStore& store) {
  AppConfig cfg;
  bool ok = true;

  // [ingest]
  const char* mode = store.GetString("ingest", "mode", "udp");
  if (detail::StrCaseEqual(mode, "udp") ||
      detail::StrCaseEqual(mode, "udp_push")) {
    cfg.stream.mode = IngestMode::kUdpPush;
  } else if (detail::StrCaseEqual(mode, "rtsp") ||
             detail::StrCaseEqual(mode, "rtsp_pull")) {
    cfg.stream.mode = IngestMode::kRtspPull;
  } else {
    ok = detail::ReportInvalid("ingest", "mode", store);
  }
  ok = detail::ReadUint(store, "ingest", "udp_port", 1U, 65535U,
                        cfg.stream.udp_port) && ok;
  cfg.stream.camera_host = store.GetString("ingest", "camera_host", "");
  ok = detail::ReadUint(store, "ingest", "camera_port", 1U, 65535U,
                        cfg.stream.camera_port) && ok;
  cfg.stream.camera_path = store.GetString("ingest", "camera_path", "");
  cfg.stream.username = store.GetString("ingest", "username", "");
  cfg.stream.password = store.GetString("ingest", "password", "");

  // [sink]
  ok = detail::ReadUint(store, "sink", "port", 1U, 65535U,
                        cfg.stream.sink_port) && ok;
  cfg.token_file = store.GetString("sink", "token_file",
                                   cfg.token_file.c_str());

  // [scan]
  ok = detail::ReadUint(store, "scan", "start", kFirstHostId, kLastHostId,
                        cfg.scan_start) && ok;
  ok = detail::ReadUint(store, "scan", "end", kFirstHostId, kLastHostId,
                        cfg.scan_end) && ok;
  ok = detail::ReadUint(store, "scan", "probe_port", 1U, 65535U,
                        cfg.scan.probe_port) && ok;
  ok = detail::ReadUint(store, "scan", "timeout_ms", 1U, 60000U,
                        cfg.scan.timeout_ms) && ok;
  ok = detail::ReadUint(store, "scan", "max_concurrency", 0U, kLastHostId,
                        cfg.scan.max_concurrency) && ok;
  cfg.scan.icmp_fallback =
      store.GetBool("scan", "icmp_fallback", cfg.scan.icmp_fallback);
  const char* backend = store.GetString("scan", "tcp_backend", "posix");
  if (detail::StrCaseEqual(backend, "posix")) {
    cfg.probe_backend = ProbeBackend::kPosix;
  } else if (detail::StrCaseEqual(backend, "sockpp")) {
    cfg.probe_backend = ProbeBackend::kSockpp;
  } else {
    ok = detail::ReportInvalid("scan", "tcp_backend", store);
  }

  // [supervisor]
  ok = detail::ReadUint(store, "supervisor", "max_reconnect", 0U, 1000U,
                        cfg.supervisor.max_reconnect_attempts) && ok;
  ok = detail::ReadUint(store, "supervisor", "reconnect_delay_ms", 1U,
                        600000U, cfg.supervisor.reconnect_delay_ms) && ok;
  ok = detail::ReadUint(store, "supervisor", "sample_interval_ms", 10U,
                        60000U, cfg.supervisor.sample_interval_ms) && ok;
  ok = detail::ReadUint(store, "supervisor", "notification_interval_ticks",
                        0U, 3600U,
                        cfg.supervisor.notification_interval_ticks) && ok;

  // [engine]
  cfg.engine.program = store.GetString("engine", "program",
                                       cfg.engine.program.c_str());
  if (cfg.engine.program.empty()) {
    ok = detail::ReportInvalid("engine", "program", store);
  }
  ok = detail::ReadUint(store, "engine", "settle_ms", 0U, 60000U,
                        cfg.engine.settle_ms) && ok;
  ok = detail::ReadUint(store, "engine", "stop_grace_ms", 0U, 60000U,
                        cfg.engine.stop_grace_ms) && ok;

  // [log]
  if (store.HasKey("log", "level") &&
      !log::ParseLevel(store.GetString("log", "level"), cfg.log_level)) {
    ok = detail::ReportInvalid("log", "level", store);
  }

  if (!ok) {
    return expected<AppConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (cfg.scan_start > cfg.scan_end) {
    TS_LOG_WARN("Config", "scan range %u-%u is empty", cfg.scan_start,
                cfg.scan_end);
  }
  return expected<AppConfig, ConfigError>::success(std::move(cfg));
}

}  // namespace ts

#endif  // TS_HAS_NETWORK

#endif  // TS_APP_CONFIG_HPP_
