/**
 * @file controller.hpp
 * @brief Caller-facing facade: interface queries, camera discovery and
 *        session control behind one object.
 */

#ifndef TS_CONTROLLER_HPP_
#define TS_CONTROLLER_HPP_

#include "ts/interface_inspector.hpp"
#include "ts/log.hpp"
#include "ts/media_engine.hpp"
#include "ts/platform.hpp"
#include "ts/status.hpp"
#include "ts/stream_config.hpp"
#include "ts/subnet_scanner.hpp"
#include "ts/supervisor.hpp"
#include "ts/tethering.hpp"
#include "ts/vocabulary.hpp"

#if TS_HAS_NETWORK

#include <string>
#include <vector>

namespace ts {

/// @brief Source of the interface list (ListInterfaces() in production).
using InterfaceListFn = std::vector<InterfaceInfo> (*)(void* ctx);

inline std::vector<InterfaceInfo> SystemInterfaces(void* /*ctx*/) {
  return ListInterfaces();
}

struct ControllerOptions {
  ScanOptions scan;
  uint32_t scan_start = kFirstHostId;
  uint32_t scan_end = kLastHostId;
  SupervisorOptions supervisor;
};

class StreamController final {
 public:
  /**
   * @param prober  Reachability capability used by every scan.
   * @param tether  Tethering state source.
   * @param engines Engine factory handed to the supervisor.
   *
   * All three are borrowed and must outlive the controller.
   */
  StreamController(HostProber& prober, TetherStateSource& tether,
                   MediaEngineFactory& engines,
                   const ControllerOptions& opts = ControllerOptions(),
                   InterfaceListFn list_fn = &SystemInterfaces,
                   void* list_ctx = nullptr,
                   AddressProviderFn address_fn = &LocalAdvertisedAddress,
                   void* address_ctx = nullptr)
      : prober_(prober),
        monitor_(tether),
        opts_(opts),
        list_fn_(list_fn),
        list_ctx_(list_ctx),
        supervisor_(engines, opts.supervisor, address_fn, address_ctx) {}

  StreamController(const StreamController&) = delete;
  StreamController& operator=(const StreamController&) = delete;

  // --------------------------------------------------------------------------
  // Session
  // --------------------------------------------------------------------------

  expected<void, SessionError> StartSession(const StreamConfig& config) {
    return supervisor_.Start(config);
  }

  expected<void, SessionError> StopSession() { return supervisor_.Stop(); }

  StatusSnapshot Status() const { return supervisor_.Status(); }

  optional<SubscriberId> Subscribe(StatusCallback fn, void* ctx = nullptr) {
    return supervisor_.Subscribe(fn, ctx);
  }

  bool Unsubscribe(SubscriberId id) { return supervisor_.Unsubscribe(id); }

  // --------------------------------------------------------------------------
  // Discovery
  // --------------------------------------------------------------------------

  std::vector<InterfaceInfo> Interfaces() const { return list_fn_(list_ctx_); }

  optional<InterfaceInfo> PrimaryTetheringInterface() const {
    return ts::PrimaryTetheringInterface(Interfaces());
  }

  bool IsEthernetTetheringActive() {
    return monitor_.IsEthernetTetheringActive();
  }

  std::vector<std::string> ScanSubnet(const std::string& subnet,
                                      uint32_t start, uint32_t end,
                                      ScanProgressFn on_progress = nullptr,
                                      void* ctx = nullptr) {
    SubnetScanner scanner(prober_, opts_.scan);
    return scanner.Scan(subnet, start, end, on_progress, ctx);
  }

  /**
   * @brief Primary tethering interface -> its /24 -> scan of the configured
   *        range -> lowest reachable address other than our own.
   *
   * Every failure is also published to status subscribers as last_error.
   */
  expected<std::string, ErrorKind> DiscoverCamera(
      ScanProgressFn on_progress = nullptr, void* ctx = nullptr) {
    auto target = ResolveTarget();
    if (!target.has_value()) {
      return expected<std::string, ErrorKind>::error(target.get_error());
    }
    SubnetScanner scanner(prober_, target.value().scan);
    std::vector<std::string> hosts =
        scanner.Scan(target.value().subnet, opts_.scan_start, opts_.scan_end,
                     on_progress, ctx);
    if (hosts.empty()) {
      return NoHostsFound(target.value());
    }
    TS_LOG_INFO("Controller", "camera candidate %s on %s", hosts[0].c_str(),
                target.value().interface_name.c_str());
    return expected<std::string, ErrorKind>::success(hosts[0]);
  }

  /// @brief Sequential variant of DiscoverCamera(): stops at the first hit.
  expected<std::string, ErrorKind> QuickDiscoverCamera() {
    auto target = ResolveTarget();
    if (!target.has_value()) {
      return expected<std::string, ErrorKind>::error(target.get_error());
    }
    SubnetScanner scanner(prober_, target.value().scan);
    optional<std::string> hit = scanner.FindFirstActive(
        target.value().subnet, opts_.scan_start, opts_.scan_end);
    if (!hit.has_value()) {
      return NoHostsFound(target.value());
    }
    return expected<std::string, ErrorKind>::success(hit.value());
  }

 private:
  struct ScanTarget {
    std::string interface_name;
    std::string subnet;
    ScanOptions scan;  ///< Configured options, own address excluded.
  };

  expected<ScanTarget, ErrorKind> ResolveTarget() {
    optional<InterfaceInfo> primary = PrimaryTetheringInterface();
    if (!primary.has_value()) {
      supervisor_.ReportFault(ErrorKind::kNoTetheringInterface,
                              "no Ethernet tethering interface is up");
      return expected<ScanTarget, ErrorKind>::error(
          ErrorKind::kNoTetheringInterface);
    }
    optional<std::string> subnet = SubnetOf(primary.value());
    if (!subnet.has_value()) {
      supervisor_.ReportFault(ErrorKind::kSubnetUndetermined,
                              primary.value().name +
                                  " has no usable IPv4 address");
      return expected<ScanTarget, ErrorKind>::error(
          ErrorKind::kSubnetUndetermined);
    }
    ScanTarget target;
    target.interface_name = primary.value().name;
    target.subnet = subnet.value();
    target.scan = opts_.scan;
    target.scan.exclude_address = primary.value().ipv4;
    return expected<ScanTarget, ErrorKind>::success(std::move(target));
  }

  expected<std::string, ErrorKind> NoHostsFound(const ScanTarget& target) {
    supervisor_.ReportFault(ErrorKind::kNoHostsFound,
                            "no reachable host on " + target.subnet +
                                " via " + target.interface_name);
    return expected<std::string, ErrorKind>::error(ErrorKind::kNoHostsFound);
  }

  HostProber& prober_;
  TetheringMonitor monitor_;
  ControllerOptions opts_;
  InterfaceListFn list_fn_;
  void* list_ctx_;
  StreamSupervisor supervisor_;
};

}  // namespace ts

#endif  // TS_HAS_NETWORK

#endif  // TS_CONTROLLER_HPP_
