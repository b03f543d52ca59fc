/**
 * @file test_app_config.cpp
 * @brief Tests for app_config.hpp
 */

#include "ts/app_config.hpp"

#include <catch2/catch_test_macros.hpp>

#if TS_HAS_NETWORK

TEST_CASE("LoadAppConfig defaults on an empty store", "[app_config]") {
  ts::ConfigStore store;
  auto r = ts::LoadAppConfig(store);
  REQUIRE(r.has_value());
  const ts::AppConfig& cfg = r.value();

  REQUIRE(cfg.stream.mode == ts::IngestMode::kUdpPush);
  REQUIRE(cfg.stream.udp_port == ts::kDefaultUdpPort);
  REQUIRE(cfg.stream.sink_port == ts::kDefaultSinkPort);
  REQUIRE(cfg.scan_start == 1U);
  REQUIRE(cfg.scan_end == 254U);
  REQUIRE(cfg.scan.probe_port == ts::kDefaultProbePort);
  REQUIRE(cfg.scan.icmp_fallback);
  REQUIRE(cfg.scan.max_concurrency == 0U);
  REQUIRE(cfg.probe_backend == ts::ProbeBackend::kPosix);
  REQUIRE(cfg.supervisor.max_reconnect_attempts == 5U);
  REQUIRE(cfg.supervisor.reconnect_delay_ms == 3000U);
  REQUIRE(cfg.supervisor.sample_interval_ms == 1000U);
  REQUIRE(cfg.supervisor.notification_interval_ticks == 5U);
  REQUIRE(cfg.engine.program == "cvlc");
}

TEST_CASE("LoadAppConfig maps every section", "[app_config]") {
  ts::ConfigStore store;
  REQUIRE(store.ApplyOverride("ingest.mode=rtsp").has_value());
  REQUIRE(store.ApplyOverride("ingest.camera_host=192.168.42.129").has_value());
  REQUIRE(store.ApplyOverride("ingest.camera_port=8554").has_value());
  REQUIRE(store.ApplyOverride("ingest.camera_path=live/ch0").has_value());
  REQUIRE(store.ApplyOverride("ingest.username=admin").has_value());
  REQUIRE(store.ApplyOverride("sink.port=9554").has_value());
  REQUIRE(store.ApplyOverride("sink.token_file=/tmp/tok").has_value());
  REQUIRE(store.ApplyOverride("scan.start=100").has_value());
  REQUIRE(store.ApplyOverride("scan.end=150").has_value());
  REQUIRE(store.ApplyOverride("scan.timeout_ms=250").has_value());
  REQUIRE(store.ApplyOverride("scan.icmp_fallback=no").has_value());
  REQUIRE(store.ApplyOverride("scan.max_concurrency=16").has_value());
  REQUIRE(store.ApplyOverride("scan.tcp_backend=sockpp").has_value());
  REQUIRE(store.ApplyOverride("supervisor.max_reconnect=2").has_value());
  REQUIRE(store.ApplyOverride("supervisor.reconnect_delay_ms=500").has_value());
  REQUIRE(store.ApplyOverride("engine.program=vlc").has_value());
  REQUIRE(store.ApplyOverride("log.level=warn").has_value());

  auto r = ts::LoadAppConfig(store);
  REQUIRE(r.has_value());
  const ts::AppConfig& cfg = r.value();

  REQUIRE(cfg.stream.mode == ts::IngestMode::kRtspPull);
  REQUIRE(cfg.stream.camera_host == "192.168.42.129");
  REQUIRE(cfg.stream.camera_port == 8554);
  REQUIRE(cfg.stream.camera_path == "live/ch0");
  REQUIRE(cfg.stream.username == "admin");
  REQUIRE(cfg.stream.sink_port == 9554);
  REQUIRE(cfg.token_file == "/tmp/tok");
  REQUIRE(cfg.scan_start == 100U);
  REQUIRE(cfg.scan_end == 150U);
  REQUIRE(cfg.scan.timeout_ms == 250U);
  REQUIRE_FALSE(cfg.scan.icmp_fallback);
  REQUIRE(cfg.scan.max_concurrency == 16U);
  REQUIRE(cfg.probe_backend == ts::ProbeBackend::kSockpp);
  REQUIRE(cfg.supervisor.max_reconnect_attempts == 2U);
  REQUIRE(cfg.supervisor.reconnect_delay_ms == 500U);
  REQUIRE(cfg.engine.program == "vlc");
  REQUIRE(cfg.log_level == ts::log::Level::kWarn);
}

TEST_CASE("LoadAppConfig rejects out-of-range values", "[app_config]") {
  const char* bad[] = {
      "sink.port=0",          "sink.port=70000",
      "ingest.udp_port=abc",  "scan.start=0",
      "scan.end=255",         "ingest.mode=tcp",
      "scan.tcp_backend=raw", "log.level=loud",
      "engine.program=",       "scan.max_concurrency=255",
  };
  for (const char* assignment : bad) {
    ts::ConfigStore store;
    REQUIRE(store.ApplyOverride(assignment).has_value());
    auto r = ts::LoadAppConfig(store);
    INFO(assignment);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == ts::ConfigError::kInvalidValue);
  }
}

#endif  // TS_HAS_NETWORK
