/**
 * @file test_bandwidth.cpp
 * @brief Tests for bandwidth.hpp
 */

#include "ts/bandwidth.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("PickByteCounter prefers read, then demux, then sent",
          "[bandwidth]") {
  ts::EngineStats s;
  REQUIRE(ts::PickByteCounter(s) == 0U);
  s.sent_bytes = 30;
  REQUIRE(ts::PickByteCounter(s) == 30U);
  s.demux_read_bytes = 20;
  REQUIRE(ts::PickByteCounter(s) == 20U);
  s.read_bytes = 10;
  REQUIRE(ts::PickByteCounter(s) == 10U);
}

TEST_CASE("BandwidthEstimator first reading only sets the baseline",
          "[bandwidth]") {
  ts::BandwidthEstimator est;
  est.Reset(1000);
  REQUIRE(est.Update(2000, 50000) == 0U);
  REQUIRE(est.SampleCount() == 0U);
  REQUIRE(est.Update(3000, 150000) == 100000U);
  REQUIRE(est.SampleCount() == 1U);
}

TEST_CASE("BandwidthEstimator averages the last five rates", "[bandwidth]") {
  ts::BandwidthEstimator est;
  est.Reset(0);
  uint64_t bytes = 1000;
  est.Update(1000, bytes);
  // Rates 1000, 2000, 3000, 4000, 5000, 6000 bytes/s.
  for (uint64_t i = 1; i <= 6; ++i) {
    bytes += i * 1000;
    est.Update(1000 + i * 1000, bytes);
  }
  REQUIRE(est.SampleCount() == ts::BandwidthEstimator::kWindow);
  REQUIRE(est.Current() == 4000U);
}

TEST_CASE("BandwidthEstimator ignores regressions and stalled clocks",
          "[bandwidth]") {
  ts::BandwidthEstimator est;
  est.Reset(0);
  est.Update(1000, 10000);
  REQUIRE(est.Update(2000, 20000) == 10000U);

  // Counter reset by an engine rebuild: no sample, new baseline.
  REQUIRE(est.Update(3000, 500) == 10000U);
  REQUIRE(est.SampleCount() == 1U);
  REQUIRE(est.Update(4000, 2500) == 6000U);

  // Same timestamp: no sample.
  REQUIRE(est.Update(4000, 9000) == 6000U);
  REQUIRE(est.SampleCount() == 2U);
}

TEST_CASE("BandwidthEstimator zero readings never sample", "[bandwidth]") {
  ts::BandwidthEstimator est;
  est.Reset(0);
  est.Update(1000, 0);
  est.Update(2000, 0);
  REQUIRE(est.SampleCount() == 0U);
  REQUIRE(est.Current() == 0U);

  ts::EngineStats s;
  s.demux_read_bytes = 4000;
  est.Update(3000, s);
  s.demux_read_bytes = 6000;
  REQUIRE(est.Update(4000, s) == 2000U);
}
