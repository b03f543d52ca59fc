/**
 * @file subnet_scanner.hpp
 * @brief Concurrent /24 host discovery with TCP-then-ICMP reachability
 *        probes.
 *
 * Scan() probes host ids on a pool of worker threads (one per host id
 * unless ScanOptions::max_concurrency caps it) plus the calling thread,
 * and joins the pool before returning, so no probe outlives the call.
 * When the system refuses a new thread the scan continues on the threads
 * already running. FindFirstActive() is strictly
 * sequential and stops at the first answer.
 */

#ifndef TS_SUBNET_SCANNER_HPP_
#define TS_SUBNET_SCANNER_HPP_

#include "ts/interface_inspector.hpp"
#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/socket.hpp"
#include "ts/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace ts {

// ============================================================================
// Options
// ============================================================================

static constexpr uint32_t kFirstHostId = 1U;
static constexpr uint32_t kLastHostId = 254U;
static constexpr uint16_t kDefaultProbePort = 22U;
static constexpr uint32_t kDefaultProbeTimeoutMs = 1000U;

struct ScanOptions {
  uint16_t probe_port = kDefaultProbePort;
  uint32_t timeout_ms = kDefaultProbeTimeoutMs;
  bool icmp_fallback = true;
  /// Upper bound on probes in flight during Scan(); 0 means one per host.
  uint32_t max_concurrency = 0U;
  /// Our own address on the subnet; never reported as a camera.
  optional<std::string> exclude_address;
};

// ============================================================================
// HostProber
// ============================================================================

/**
 * @brief Reachability capability. Implementations must be safe to call
 *        from many threads at once.
 */
class HostProber {
 public:
  virtual ~HostProber() = default;
  virtual bool IsReachable(const std::string& address) = 0;
};

/// @brief TCP connect to a fixed port within a timeout.
class TcpConnectProbe final : public HostProber {
 public:
  TcpConnectProbe(uint16_t port, uint32_t timeout_ms) noexcept
      : port_(port), timeout_ms_(timeout_ms) {}

  bool IsReachable(const std::string& address) override {
    auto addr = SocketAddress::FromIpv4(address.c_str(), port_);
    if (!addr.has_value()) return false;
    auto sock = TcpSocket::Create();
    if (!sock.has_value()) {
      TS_LOG_WARN("Scanner", "tcp socket creation failed for %s",
                  address.c_str());
      return false;
    }
    return sock.value().ConnectTimeout(addr.value(), timeout_ms_).has_value();
  }

 private:
  uint16_t port_;
  uint32_t timeout_ms_;
};

/// @brief ICMP echo within a timeout. Unsupported sockets count as no reply.
class IcmpEchoProbe final : public HostProber {
 public:
  explicit IcmpEchoProbe(uint32_t timeout_ms) noexcept
      : timeout_ms_(timeout_ms) {}

  bool IsReachable(const std::string& address) override {
    auto addr = SocketAddress::FromIpv4(address.c_str(), 0);
    if (!addr.has_value()) return false;
    auto sock = IcmpSocket::Create();
    if (!sock.has_value()) {
      if (!warned_.exchange(true)) {
        TS_LOG_WARN("Scanner", "icmp echo unavailable, tcp probe only");
      }
      return false;
    }
    return sock.value().Echo(addr.value(), timeout_ms_).has_value();
  }

 private:
  uint32_t timeout_ms_;
  std::atomic<bool> warned_{false};
};

/// @brief Production prober: TCP connect first, ICMP echo as fallback.
class ReachabilityProber final : public HostProber {
 public:
  explicit ReachabilityProber(const ScanOptions& opts = ScanOptions()) noexcept
      : tcp_(opts.probe_port, opts.timeout_ms),
        icmp_(opts.timeout_ms),
        icmp_fallback_(opts.icmp_fallback) {}

  bool IsReachable(const std::string& address) override {
    if (tcp_.IsReachable(address)) return true;
    return icmp_fallback_ && icmp_.IsReachable(address);
  }

 private:
  TcpConnectProbe tcp_;
  IcmpEchoProbe icmp_;
  bool icmp_fallback_;
};

// ============================================================================
// SubnetScanner
// ============================================================================

/**
 * @brief Progress callback: invoked once per completed probe from the
 *        thread that ran it. Each value of @p completed in [1, total] is
 *        delivered exactly once, in no guaranteed order.
 */
using ScanProgressFn = void (*)(uint32_t completed, uint32_t total, void* ctx);

class SubnetScanner final {
 public:
  /// @param prober Borrowed; must outlive the scanner.
  explicit SubnetScanner(HostProber& prober,
                         const ScanOptions& opts = ScanOptions())
      : prober_(prober), opts_(opts) {}

  /// @brief Number of probes a range issues (0 when start > end).
  static uint32_t ProbeCount(uint32_t start, uint32_t end) noexcept {
    ClampRange(start, end);
    return (start > end) ? 0U : (end - start + 1U);
  }

  /**
   * @brief Probe every host in [start, end] concurrently.
   * @return Reachable addresses in no particular order; empty for an
   *         empty range or an invalid subnet.
   */
  std::vector<std::string> Scan(const std::string& subnet,
                                uint32_t start = kFirstHostId,
                                uint32_t end = kLastHostId,
                                ScanProgressFn on_progress = nullptr,
                                void* ctx = nullptr) {
    std::vector<std::string> found;
    if (!IsValidSubnet(subnet)) {
      TS_LOG_ERROR("Scanner", "invalid subnet '%s'", subnet.c_str());
      return found;
    }
    ClampRange(start, end);
    if (start > end) {
      TS_LOG_DEBUG("Scanner", "empty range on %s, nothing to probe",
                   subnet.c_str());
      return found;
    }

    const uint32_t total = end - start + 1U;
    TS_LOG_INFO("Scanner", "scanning %s.%u-%u (%u hosts)", subnet.c_str(),
                start, end, total);

    std::vector<std::string> addresses;
    addresses.reserve(total);
    for (uint32_t id = start; id <= end; ++id) {
      addresses.push_back(HostAddress(subnet, id));
    }
    std::vector<uint8_t> hits(total, 0U);
    std::atomic<uint32_t> next{0U};
    std::atomic<uint32_t> completed{0U};

    auto drain = [this, total, on_progress, ctx, &addresses, &hits, &next,
                  &completed]() {
      for (;;) {
        const uint32_t i = next.fetch_add(1U, std::memory_order_relaxed);
        if (i >= total) return;
        hits[i] = prober_.IsReachable(addresses[i]) ? 1U : 0U;
        const uint32_t done =
            completed.fetch_add(1U, std::memory_order_acq_rel) + 1U;
        if (on_progress != nullptr) {
          on_progress(done, total, ctx);
        }
      }
    };

    // The calling thread is one of the workers.
    const uint32_t width = WorkerCount(total);
    std::vector<std::thread> workers;
    workers.reserve(width - 1U);
    for (uint32_t w = 1U; w < width; ++w) {
      try {
        workers.emplace_back(drain);
      } catch (const std::system_error& e) {
        TS_LOG_WARN("Scanner", "probe thread %u of %u not started (%s)", w,
                    width, e.what());
        break;
      }
    }
    drain();
    for (auto& t : workers) {
      t.join();
    }

    for (uint32_t i = 0; i < total; ++i) {
      if (hits[i] == 0U || IsExcluded(addresses[i])) continue;
      TS_LOG_DEBUG("Scanner", "host %s is reachable", addresses[i].c_str());
      found.push_back(addresses[i]);
    }
    TS_LOG_INFO("Scanner", "scan of %s finished: %zu active", subnet.c_str(),
                found.size());
    return found;
  }

  /**
   * @brief Sequential search that returns on the first reachable host.
   *
   * Tries the addresses tethering stacks commonly hand out (.1, .129, .10,
   * .100, .2, when inside the range) before sweeping the rest in order.
   */
  optional<std::string> FindFirstActive(const std::string& subnet,
                                        uint32_t start = kFirstHostId,
                                        uint32_t end = kLastHostId) {
    if (!IsValidSubnet(subnet)) {
      TS_LOG_ERROR("Scanner", "invalid subnet '%s'", subnet.c_str());
      return {};
    }
    ClampRange(start, end);
    if (start > end) return {};

    static constexpr uint32_t kCommonHostIds[] = {1U, 129U, 10U, 100U, 2U};
    for (uint32_t id : kCommonHostIds) {
      if (id < start || id > end) continue;
      std::string address = HostAddress(subnet, id);
      if (!IsExcluded(address) && prober_.IsReachable(address)) {
        TS_LOG_INFO("Scanner", "found %s (common address)", address.c_str());
        return optional<std::string>(std::move(address));
      }
    }

    for (uint32_t id = start; id <= end; ++id) {
      if (IsCommonHostId(id)) continue;
      std::string address = HostAddress(subnet, id);
      if (!IsExcluded(address) && prober_.IsReachable(address)) {
        TS_LOG_INFO("Scanner", "found %s", address.c_str());
        return optional<std::string>(std::move(address));
      }
    }
    TS_LOG_INFO("Scanner", "no reachable host on %s.%u-%u", subnet.c_str(),
                start, end);
    return {};
  }

 private:
  static void ClampRange(uint32_t& start, uint32_t& end) noexcept {
    if (start < kFirstHostId) start = kFirstHostId;
    if (end > kLastHostId) end = kLastHostId;
  }

  uint32_t WorkerCount(uint32_t total) const noexcept {
    if (opts_.max_concurrency == 0U || opts_.max_concurrency > total) {
      return total;
    }
    return opts_.max_concurrency;
  }

  static bool IsCommonHostId(uint32_t id) noexcept {
    return id == 1U || id == 129U || id == 10U || id == 100U || id == 2U;
  }

  bool IsExcluded(const std::string& address) const {
    return opts_.exclude_address.has_value() &&
           opts_.exclude_address.value() == address;
  }

  HostProber& prober_;
  ScanOptions opts_;
};

}  // namespace ts

#endif  // TS_SUBNET_SCANNER_HPP_
