/**
 * @file test_controller.cpp
 * @brief Tests for controller.hpp with injected interfaces and prober.
 */

#include "ts/controller.hpp"

#include <catch2/catch_test_macros.hpp>

#if TS_HAS_NETWORK

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace {

class SetProber final : public ts::HostProber {
 public:
  explicit SetProber(std::set<std::string> active)
      : active_(std::move(active)) {}

  bool IsReachable(const std::string& address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++probes_;
    return active_.count(address) != 0U;
  }

  uint32_t Probes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return probes_;
  }

 private:
  std::mutex mutex_;
  std::set<std::string> active_;
  uint32_t probes_ = 0U;
};

/// Engine that opens and plays without emitting anything.
class IdleEngine final : public ts::MediaEngine {
 public:
  ts::expected<void, ts::EngineError> Open(
      const ts::EngineLaunchSpec& spec, const ts::EngineEventSink&) override {
    source = spec.source_url;
    return ts::expected<void, ts::EngineError>::success();
  }
  ts::expected<void, ts::EngineError> Play() override {
    return ts::expected<void, ts::EngineError>::success();
  }
  void Stop() override {}
  ts::optional<ts::EngineStats> ReadStats() override { return {}; }

  std::string source;
};

class IdleEngineFactory final : public ts::MediaEngineFactory {
 public:
  std::unique_ptr<ts::MediaEngine> Create() override {
    ++created;
    return std::unique_ptr<ts::MediaEngine>(new IdleEngine());
  }
  uint32_t created = 0U;
};

std::vector<ts::InterfaceInfo> ListFromCtx(void* ctx) {
  return *static_cast<std::vector<ts::InterfaceInfo>*>(ctx);
}

ts::optional<std::string> LanAddress(void*) {
  return ts::optional<std::string>(std::string("192.168.1.20"));
}

ts::InterfaceInfo MakeIf(const char* name, const char* ipv4) {
  ts::InterfaceInfo info;
  info.name = name;
  info.display_name = name;
  if (ipv4 != nullptr) info.ipv4 = std::string(ipv4);
  info.is_up = true;
  return info;
}

/// Records every snapshot published to a subscriber.
struct FeedLog {
  std::mutex mutex;
  std::vector<ts::StatusSnapshot> snapshots;

  ts::StatusSnapshot LastSnapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return snapshots.back();
  }
  size_t Count() {
    std::lock_guard<std::mutex> lock(mutex);
    return snapshots.size();
  }
};

void OnStatus(const ts::StatusSnapshot& snap, ts::StatusReason, void* ctx) {
  auto* log = static_cast<FeedLog*>(ctx);
  std::lock_guard<std::mutex> lock(log->mutex);
  log->snapshots.push_back(snap);
}

struct Fixture {
  explicit Fixture(std::set<std::string> active, uint32_t start = 1U,
                   uint32_t end = 254U)
      : prober(std::move(active)) {
    opts.scan_start = start;
    opts.scan_end = end;
    opts.supervisor.reconnect_delay_ms = 20U;
  }

  SetProber prober;
  ts::StaticTetherStateSource tether;
  IdleEngineFactory engines;
  ts::ControllerOptions opts;
  std::vector<ts::InterfaceInfo> interfaces;
};

}  // namespace

TEST_CASE("DiscoverCamera without a tethering interface", "[controller]") {
  Fixture f({"192.168.42.129"});
  f.interfaces = {MakeIf("wlan0", "192.168.1.20")};
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  FeedLog feed;
  REQUIRE(c.Subscribe(&OnStatus, &feed).has_value());
  auto r = c.DiscoverCamera();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ts::ErrorKind::kNoTetheringInterface);
  REQUIRE(f.prober.Probes() == 0U);

  REQUIRE(feed.Count() == 1U);
  auto snap = feed.LastSnapshot();
  REQUIRE(snap.state == ts::SessionState::kIdle);
  REQUIRE(snap.last_error.has_value());
  REQUIRE(snap.last_error.value().kind ==
          ts::ErrorKind::kNoTetheringInterface);
  REQUIRE(c.Status().last_error.value().kind ==
          ts::ErrorKind::kNoTetheringInterface);
}

TEST_CASE("DiscoverCamera with an address-less interface", "[controller]") {
  Fixture f({});
  f.interfaces = {MakeIf("eth0", nullptr)};
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  FeedLog feed;
  REQUIRE(c.Subscribe(&OnStatus, &feed).has_value());
  auto r = c.DiscoverCamera();
  REQUIRE(r.get_error() == ts::ErrorKind::kSubnetUndetermined);
  REQUIRE(feed.Count() == 1U);
  REQUIRE(feed.LastSnapshot().last_error.value().kind ==
          ts::ErrorKind::kSubnetUndetermined);

  REQUIRE(c.QuickDiscoverCamera().get_error() ==
          ts::ErrorKind::kSubnetUndetermined);
  REQUIRE(feed.Count() == 2U);
  REQUIRE(feed.LastSnapshot().last_error.value().kind ==
          ts::ErrorKind::kSubnetUndetermined);
}

TEST_CASE("DiscoverCamera when nothing answers", "[controller]") {
  Fixture f({}, 1U, 16U);
  f.interfaces = {MakeIf("eth0", "192.168.42.7")};
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  FeedLog feed;
  REQUIRE(c.Subscribe(&OnStatus, &feed).has_value());
  auto r = c.DiscoverCamera();
  REQUIRE(r.get_error() == ts::ErrorKind::kNoHostsFound);
  REQUIRE(f.prober.Probes() == 16U);
  REQUIRE(feed.Count() == 1U);
  auto snap = feed.LastSnapshot();
  REQUIRE(snap.last_error.value().kind == ts::ErrorKind::kNoHostsFound);
  REQUIRE_FALSE(snap.last_error.value().message.empty());

  REQUIRE(c.QuickDiscoverCamera().get_error() == ts::ErrorKind::kNoHostsFound);
  REQUIRE(feed.LastSnapshot().last_error.value().kind ==
          ts::ErrorKind::kNoHostsFound);

  // The next session clears the discovery fault.
  ts::StreamConfig cfg;
  REQUIRE(c.StartSession(cfg).has_value());
  REQUIRE_FALSE(c.Status().last_error.has_value());
  REQUIRE(c.StopSession().has_value());
}

TEST_CASE("DiscoverCamera returns the lowest reachable host but never us",
          "[controller]") {
  Fixture f({"192.168.42.7", "192.168.42.129", "192.168.42.200"});
  f.interfaces = {MakeIf("lo", "127.0.0.1"), MakeIf("wlan0", "10.1.1.4"),
                  MakeIf("eth0", "192.168.42.7")};
  f.interfaces[0].is_loopback = true;
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);

  auto primary = c.PrimaryTetheringInterface();
  REQUIRE(primary.has_value());
  REQUIRE(primary.value().name == "eth0");
  REQUIRE(c.Interfaces().size() == 3U);

  auto r = c.DiscoverCamera();
  REQUIRE(r.has_value());
  REQUIRE(r.value() == "192.168.42.129");

  auto quick = c.QuickDiscoverCamera();
  REQUIRE(quick.has_value());
  REQUIRE(quick.value() == "192.168.42.129");
}

TEST_CASE("ScanSubnet forwards the requested range", "[controller]") {
  Fixture f({"10.13.207.3"});
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  auto hosts = c.ScanSubnet("10.13.207", 1, 5);
  REQUIRE(hosts == std::vector<std::string>{"10.13.207.3"});
  REQUIRE(c.ScanSubnet("10.13.207", 9, 4).empty());
}

TEST_CASE("IsEthernetTetheringActive follows the tether source",
          "[controller]") {
  Fixture f({});
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  f.tether.SetInterfaces({"usb0"});
  REQUIRE_FALSE(c.IsEthernetTetheringActive());
  f.tether.SetInterfaces({"eth0"});
  REQUIRE(c.IsEthernetTetheringActive());
}

TEST_CASE("Controller session passthrough", "[controller]") {
  Fixture f({});
  ts::StreamController c(f.prober, f.tether, f.engines, f.opts, &ListFromCtx,
                         &f.interfaces, &LanAddress);
  ts::StreamConfig cfg;
  cfg.token = "a1b2c3d4e5f6a7b8";
  REQUIRE(c.StartSession(cfg).has_value());
  REQUIRE(f.engines.created == 1U);
  auto snap = c.Status();
  REQUIRE(snap.state == ts::SessionState::kStarting);
  REQUIRE(snap.published_url.value() ==
          "rtsp://192.168.1.20:8554/stream-a1b2c3d4e5f6a7b8");
  REQUIRE(c.StartSession(cfg).get_error() ==
          ts::SessionError::kAlreadyRunning);
  REQUIRE(c.StopSession().has_value());
  REQUIRE(c.Status().state == ts::SessionState::kStopped);
  REQUIRE(c.StopSession().get_error() == ts::SessionError::kNotRunning);
}

#endif  // TS_HAS_NETWORK
