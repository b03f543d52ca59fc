/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "ts/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

TEST_CASE("Log SetLevel round trip", "[log]") {
  auto prev = ts::log::GetLevel();
  ts::log::SetLevel(ts::log::Level::kError);
  REQUIRE(ts::log::GetLevel() == ts::log::Level::kError);
  ts::log::SetLevel(prev);
}

TEST_CASE("Log ParseLevel accepts known names", "[log]") {
  ts::log::Level level = ts::log::Level::kDebug;
  REQUIRE(ts::log::ParseLevel("warn", level));
  REQUIRE(level == ts::log::Level::kWarn);
  REQUIRE(ts::log::ParseLevel("off", level));
  REQUIRE(level == ts::log::Level::kOff);
  REQUIRE(ts::log::ParseLevel("debug", level));
  REQUIRE(level == ts::log::Level::kDebug);
}

TEST_CASE("Log ParseLevel rejects unknown names", "[log]") {
  ts::log::Level level = ts::log::Level::kInfo;
  REQUIRE_FALSE(ts::log::ParseLevel("verbose", level));
  REQUIRE_FALSE(ts::log::ParseLevel("warning", level));
  REQUIRE_FALSE(ts::log::ParseLevel("", level));
  REQUIRE_FALSE(ts::log::ParseLevel(nullptr, level));
  REQUIRE(level == ts::log::Level::kInfo);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  ts::log::Init();
  REQUIRE(ts::log::IsInitialized());
  ts::log::Shutdown();
  REQUIRE_FALSE(ts::log::IsInitialized());
}

TEST_CASE("Log macros run at every level", "[log]") {
  auto prev = ts::log::GetLevel();
  ts::log::SetLevel(ts::log::Level::kDebug);
  TS_LOG_DEBUG("Test", "debug %d", 1);
  TS_LOG_INFO("Test", "info %s", "msg");
  TS_LOG_WARN("Test", "warn");
  TS_LOG_ERROR("Test", "error %d %d", 1, 2);

  ts::log::SetLevel(ts::log::Level::kOff);
  TS_LOG_ERROR("Test", "suppressed");
  ts::log::SetLevel(prev);
  SUCCEED();
}

TEST_CASE("Log concurrent writers", "[log]") {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 20; ++i) {
        TS_LOG_DEBUG("Test", "thread %d line %d", t, i);
      }
    });
  }
  for (auto& th : threads) th.join();
  SUCCEED();
}
