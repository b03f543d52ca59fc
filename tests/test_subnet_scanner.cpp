/**
 * @file test_subnet_scanner.cpp
 * @brief Tests for subnet_scanner.hpp with an in-memory prober.
 */

#include "ts/subnet_scanner.hpp"

#include <catch2/catch_test_macros.hpp>

#if TS_HAS_NETWORK

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

namespace {

class FakeProber final : public ts::HostProber {
 public:
  explicit FakeProber(std::set<std::string> active)
      : active_(std::move(active)) {}

  bool IsReachable(const std::string& address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    probed_.push_back(address);
    return active_.count(address) != 0U;
  }

  std::vector<std::string> Probed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

 private:
  std::mutex mutex_;
  std::set<std::string> active_;
  std::vector<std::string> probed_;
};

/// Counts probes in flight and the threads that ran them.
class SlowProber final : public ts::HostProber {
 public:
  bool IsReachable(const std::string& address) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++in_flight_;
      peak_ = std::max(peak_, in_flight_);
      threads_.insert(std::this_thread::get_id());
      probed_.insert(address);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    return address == "10.13.207.33";
  }

  uint32_t Peak() {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }
  std::set<std::thread::id> Threads() {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_;
  }
  size_t ProbedCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_.size();
  }

 private:
  std::mutex mutex_;
  uint32_t in_flight_ = 0;
  uint32_t peak_ = 0;
  std::set<std::thread::id> threads_;
  std::set<std::string> probed_;
};

struct ProgressLog {
  std::mutex mutex;
  std::vector<uint32_t> completed;
  uint32_t total = 0;
};

void OnProgress(uint32_t completed, uint32_t total, void* ctx) {
  auto* log = static_cast<ProgressLog*>(ctx);
  std::lock_guard<std::mutex> lock(log->mutex);
  log->completed.push_back(completed);
  log->total = total;
}

}  // namespace

TEST_CASE("Scan finds the single active host", "[scanner]") {
  FakeProber prober({"10.13.207.3"});
  ts::SubnetScanner scanner(prober);
  auto found = scanner.Scan("10.13.207", 1, 5);
  REQUIRE(found.size() == 1U);
  REQUIRE(found[0] == "10.13.207.3");
  REQUIRE(prober.Probed().size() == 5U);
}

TEST_CASE("Scan with start greater than end probes nothing", "[scanner]") {
  FakeProber prober({"10.0.0.1"});
  ts::SubnetScanner scanner(prober);
  REQUIRE(scanner.Scan("10.0.0", 10, 5).empty());
  REQUIRE(prober.Probed().empty());
  REQUIRE(ts::SubnetScanner::ProbeCount(10, 5) == 0U);
  REQUIRE(ts::SubnetScanner::ProbeCount(1, 254) == 254U);
  REQUIRE(ts::SubnetScanner::ProbeCount(0, 300) == 254U);
}

TEST_CASE("Scan rejects an invalid subnet", "[scanner]") {
  FakeProber prober({});
  ts::SubnetScanner scanner(prober);
  REQUIRE(scanner.Scan("10.0", 1, 4).empty());
  REQUIRE(prober.Probed().empty());
}

TEST_CASE("Scan progress reaches the total exactly once", "[scanner]") {
  FakeProber prober({"192.168.42.7", "192.168.42.20"});
  ts::SubnetScanner scanner(prober);
  ProgressLog log;
  auto found = scanner.Scan("192.168.42", 1, 32, &OnProgress, &log);
  std::sort(found.begin(), found.end());
  REQUIRE(found == std::vector<std::string>{"192.168.42.20", "192.168.42.7"});

  REQUIRE(log.total == 32U);
  REQUIRE(log.completed.size() == 32U);
  auto sorted = log.completed;
  std::sort(sorted.begin(), sorted.end());
  for (uint32_t i = 0; i < 32U; ++i) {
    REQUIRE(sorted[i] == i + 1U);
  }
}

TEST_CASE("Scan respects max_concurrency", "[scanner]") {
  SlowProber prober;
  ts::ScanOptions opts;
  opts.max_concurrency = 4U;
  ts::SubnetScanner scanner(prober, opts);
  ProgressLog log;
  auto found = scanner.Scan("10.13.207", 1, 40, &OnProgress, &log);

  REQUIRE(found == std::vector<std::string>{"10.13.207.33"});
  REQUIRE(prober.ProbedCount() == 40U);
  REQUIRE(prober.Peak() <= 4U);
  REQUIRE(prober.Threads().size() <= 4U);
  REQUIRE(log.completed.size() == 40U);
  REQUIRE(*std::max_element(log.completed.begin(), log.completed.end()) ==
          40U);
}

TEST_CASE("Scan completes on the calling thread alone", "[scanner]") {
  // A width of one starts no extra threads, the same state a scan is left
  // in when the system refuses every new thread.
  SlowProber prober;
  ts::ScanOptions opts;
  opts.max_concurrency = 1U;
  ts::SubnetScanner scanner(prober, opts);
  ProgressLog log;
  auto found = scanner.Scan("10.13.207", 30, 36, &OnProgress, &log);

  REQUIRE(found == std::vector<std::string>{"10.13.207.33"});
  REQUIRE(prober.ProbedCount() == 7U);
  REQUIRE(prober.Peak() == 1U);
  const auto threads = prober.Threads();
  REQUIRE(threads.size() == 1U);
  REQUIRE(*threads.begin() == std::this_thread::get_id());
  REQUIRE(log.completed ==
          std::vector<uint32_t>{1U, 2U, 3U, 4U, 5U, 6U, 7U});
}

TEST_CASE("Scan drops the excluded own address", "[scanner]") {
  FakeProber prober({"192.168.42.1", "192.168.42.129"});
  ts::ScanOptions opts;
  opts.exclude_address = std::string("192.168.42.1");
  ts::SubnetScanner scanner(prober, opts);
  auto found = scanner.Scan("192.168.42", 1, 254);
  REQUIRE(found.size() == 1U);
  REQUIRE(found[0] == "192.168.42.129");
}

TEST_CASE("FindFirstActive tries common addresses first", "[scanner]") {
  FakeProber prober({"192.168.42.129", "192.168.42.3"});
  ts::SubnetScanner scanner(prober);
  auto hit = scanner.FindFirstActive("192.168.42");
  REQUIRE(hit.has_value());
  REQUIRE(hit.value() == "192.168.42.129");
  auto probed = prober.Probed();
  REQUIRE(probed.size() == 2U);
  REQUIRE(probed[0] == "192.168.42.1");
  REQUIRE(probed[1] == "192.168.42.129");
}

TEST_CASE("FindFirstActive sweeps the rest in order", "[scanner]") {
  FakeProber prober({"10.1.1.7", "10.1.1.9"});
  ts::SubnetScanner scanner(prober);
  auto hit = scanner.FindFirstActive("10.1.1", 3, 20);
  REQUIRE(hit.has_value());
  REQUIRE(hit.value() == "10.1.1.7");
  auto probed = prober.Probed();
  // .10 is the only common id in range, so it is tried before .3.
  REQUIRE(probed.front() == "10.1.1.10");
  REQUIRE(probed.back() == "10.1.1.7");
  REQUIRE(probed.size() == 6U);
}

TEST_CASE("FindFirstActive empty when nothing answers", "[scanner]") {
  FakeProber prober({});
  ts::SubnetScanner scanner(prober);
  REQUIRE_FALSE(scanner.FindFirstActive("10.2.2", 1, 8).has_value());
  REQUIRE(prober.Probed().size() == 8U);
}

TEST_CASE("TcpConnectProbe against a loopback listener", "[scanner]") {
  auto listener = ts::TcpListener::Create();
  REQUIRE(listener.has_value());
  auto any = ts::SocketAddress::FromIpv4("127.0.0.1", 0);
  REQUIRE(listener.value().Bind(any.value()).has_value());
  REQUIRE(listener.value().Listen().has_value());

  ts::TcpConnectProbe probe(listener.value().LocalPort(), 500);
  REQUIRE(probe.IsReachable("127.0.0.1"));
  REQUIRE_FALSE(probe.IsReachable("bogus"));
}

#endif  // TS_HAS_NETWORK
