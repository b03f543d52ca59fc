/**
 * @file test_status.cpp
 * @brief Tests for status.hpp
 */

#include "ts/status.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Recorder {
  std::vector<ts::StatusReason> reasons;
  std::vector<ts::SessionState> states;
};

void Record(const ts::StatusSnapshot& snap, ts::StatusReason reason,
            void* ctx) {
  auto* r = static_cast<Recorder*>(ctx);
  r->reasons.push_back(reason);
  r->states.push_back(snap.state);
}

}  // namespace

TEST_CASE("FormatUptime switches to hours at 3600 s", "[status]") {
  REQUIRE(ts::FormatUptime(0) == "00:00");
  REQUIRE(ts::FormatUptime(59) == "00:59");
  REQUIRE(ts::FormatUptime(61) == "01:01");
  REQUIRE(ts::FormatUptime(3599) == "59:59");
  REQUIRE(ts::FormatUptime(3600) == "1:00:00");
  REQUIRE(ts::FormatUptime(3661) == "1:01:01");
  REQUIRE(ts::FormatUptime(36000 + 5) == "10:00:05");
}

TEST_CASE("FormatBandwidth units", "[status]") {
  REQUIRE(ts::FormatBandwidth(0) == "0 B/s");
  REQUIRE(ts::FormatBandwidth(512) == "512 B/s");
  REQUIRE(ts::FormatBandwidth(1536) == "1.5 KB/s");
  REQUIRE(ts::FormatBandwidth(3 * 1024 * 1024) == "3.0 MB/s");
}

TEST_CASE("FormatNotificationText", "[status]") {
  ts::StatusSnapshot snap;
  snap.state = ts::SessionState::kStreaming;
  snap.uptime_seconds = 75;
  snap.published_url = std::string("rtsp://10.0.0.2:8554/stream");
  REQUIRE(ts::FormatNotificationText(snap) ==
          "rtsp://10.0.0.2:8554/stream | Uptime: 01:15");
  snap.published_url.reset();
  REQUIRE(ts::FormatNotificationText(snap) == "- | Uptime: 01:15");
}

TEST_CASE("Session state names and activity", "[status]") {
  REQUIRE(std::string(ts::SessionStateName(ts::SessionState::kReconnecting)) ==
          "Reconnecting");
  REQUIRE_FALSE(ts::IsSessionActive(ts::SessionState::kIdle));
  REQUIRE(ts::IsSessionActive(ts::SessionState::kStarting));
  REQUIRE(ts::IsSessionActive(ts::SessionState::kStreaming));
  REQUIRE(ts::IsSessionActive(ts::SessionState::kReconnecting));
  REQUIRE_FALSE(ts::IsSessionActive(ts::SessionState::kStopped));
}

TEST_CASE("StatusPublisher delivers to every subscriber", "[status]") {
  ts::StatusPublisher pub;
  Recorder a;
  Recorder b;
  auto ida = pub.Subscribe(&Record, &a);
  auto idb = pub.Subscribe(&Record, &b);
  REQUIRE(ida.has_value());
  REQUIRE(idb.has_value());
  REQUIRE(ida.value() != idb.value());
  REQUIRE(pub.SubscriberCount() == 2U);

  ts::StatusSnapshot snap;
  snap.state = ts::SessionState::kStarting;
  pub.Publish(snap, ts::StatusReason::kTransition);
  REQUIRE(a.states.size() == 1U);
  REQUIRE(b.states.size() == 1U);
  REQUIRE(pub.Last().state == ts::SessionState::kStarting);

  REQUIRE(pub.Unsubscribe(ida.value()));
  REQUIRE_FALSE(pub.Unsubscribe(ida.value()));
  snap.state = ts::SessionState::kStreaming;
  pub.Publish(snap, ts::StatusReason::kTick);
  REQUIRE(a.states.size() == 1U);
  REQUIRE(b.states.size() == 2U);
  REQUIRE(b.reasons.back() == ts::StatusReason::kTick);
}

TEST_CASE("StatusPublisher rejects null and overflow", "[status]") {
  ts::StatusPublisher pub;
  REQUIRE_FALSE(pub.Subscribe(nullptr).has_value());
  Recorder r;
  for (uint32_t i = 0; i < ts::StatusPublisher::kMaxSubscribers; ++i) {
    REQUIRE(pub.Subscribe(&Record, &r).has_value());
  }
  REQUIRE_FALSE(pub.Subscribe(&Record, &r).has_value());
}
