/**
 * @file status.hpp
 * @brief Session state, immutable status snapshots and the publisher that
 *        fans them out to subscribers.
 */

#ifndef TS_STATUS_HPP_
#define TS_STATUS_HPP_

#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace ts {

// ============================================================================
// SessionState
// ============================================================================

enum class SessionState : uint8_t {
  kIdle = 0,
  kStarting,
  kStreaming,
  kReconnecting,
  kStopped
};

inline const char* SessionStateName(SessionState s) noexcept {
  switch (s) {
    case SessionState::kIdle:         return "Idle";
    case SessionState::kStarting:     return "Starting";
    case SessionState::kStreaming:    return "Streaming";
    case SessionState::kReconnecting: return "Reconnecting";
    case SessionState::kStopped:      return "Stopped";
  }
  return "Unknown";
}

/// @brief Starting, Streaming or Reconnecting.
inline bool IsSessionActive(SessionState s) noexcept {
  return s == SessionState::kStarting || s == SessionState::kStreaming ||
         s == SessionState::kReconnecting;
}

// ============================================================================
// StatusSnapshot
// ============================================================================

struct SessionFault {
  ErrorKind kind = ErrorKind::kStreamError;
  std::string message;
};

/// @brief Point-in-time view of the session. Copied to every subscriber.
struct StatusSnapshot {
  SessionState state = SessionState::kIdle;
  uint64_t uptime_seconds = 0;
  optional<std::string> published_url;
  uint64_t bandwidth_bytes_per_sec = 0;
  optional<SessionFault> last_error;
  uint32_t reconnect_attempt = 0;
};

enum class StatusReason : uint8_t {
  kTransition = 0,       ///< State or error changed.
  kTick,                 ///< Periodic sample while streaming.
  kNotificationRefresh   ///< Every Nth tick, for persistent indicators.
};

// ============================================================================
// Formatting
// ============================================================================

/// @brief "H:MM:SS" when at least an hour has passed, else "MM:SS".
inline std::string FormatUptime(uint64_t seconds) {
  const uint64_t h = seconds / 3600U;
  const uint64_t m = (seconds % 3600U) / 60U;
  const uint64_t s = seconds % 60U;
  char buf[32];
  if (h > 0U) {
    (void)std::snprintf(buf, sizeof(buf), "%llu:%02llu:%02llu",
                        static_cast<unsigned long long>(h),
                        static_cast<unsigned long long>(m),
                        static_cast<unsigned long long>(s));
  } else {
    (void)std::snprintf(buf, sizeof(buf), "%02llu:%02llu",
                        static_cast<unsigned long long>(m),
                        static_cast<unsigned long long>(s));
  }
  return buf;
}

/// @brief Human-readable rate: "512 B/s", "1.5 KB/s", "2.3 MB/s".
inline std::string FormatBandwidth(uint64_t bytes_per_sec) {
  char buf[32];
  if (bytes_per_sec >= 1024U * 1024U) {
    (void)std::snprintf(buf, sizeof(buf), "%.1f MB/s",
                        static_cast<double>(bytes_per_sec) / (1024.0 * 1024.0));
  } else if (bytes_per_sec >= 1024U) {
    (void)std::snprintf(buf, sizeof(buf), "%.1f KB/s",
                        static_cast<double>(bytes_per_sec) / 1024.0);
  } else {
    (void)std::snprintf(buf, sizeof(buf), "%llu B/s",
                        static_cast<unsigned long long>(bytes_per_sec));
  }
  return buf;
}

/// @brief One-line text for a persistent "streaming" indicator.
inline std::string FormatNotificationText(const StatusSnapshot& snap) {
  const std::string url =
      snap.published_url.has_value() ? snap.published_url.value() : "-";
  return url + " | Uptime: " + FormatUptime(snap.uptime_seconds);
}

// ============================================================================
// StatusPublisher
// ============================================================================

using StatusCallback = void (*)(const StatusSnapshot& snapshot,
                                StatusReason reason, void* ctx);

/**
 * @brief Fixed-capacity subscriber table.
 *
 * Callbacks run on the publishing thread (the supervisor loop or a caller
 * of Start/Stop) and must not call back into the supervisor.
 */
class StatusPublisher final {
 public:
  static constexpr uint32_t kMaxSubscribers = 8U;

  StatusPublisher() = default;
  StatusPublisher(const StatusPublisher&) = delete;
  StatusPublisher& operator=(const StatusPublisher&) = delete;

  /// @return An id, or empty when the table is full or @p fn is null.
  optional<SubscriberId> Subscribe(StatusCallback fn, void* ctx = nullptr) {
    if (fn == nullptr) return {};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.fn == nullptr) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.id = next_id_++;
        return optional<SubscriberId>(SubscriberId(slot.id));
      }
    }
    TS_LOG_WARN("Status", "subscriber table full (%u)", kMaxSubscribers);
    return {};
  }

  bool Unsubscribe(SubscriberId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.fn != nullptr && slot.id == id.value()) {
        slot = Slot();
        return true;
      }
    }
    return false;
  }

  void Publish(const StatusSnapshot& snapshot, StatusReason reason) {
    Slot copy[kMaxSubscribers];
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_ = snapshot;
      for (uint32_t i = 0; i < kMaxSubscribers; ++i) {
        copy[i] = slots_[i];
      }
    }
    for (const auto& slot : copy) {
      if (slot.fn != nullptr) {
        slot.fn(snapshot, reason, slot.ctx);
      }
    }
  }

  /// @brief Most recently published snapshot (default-constructed if none).
  StatusSnapshot Last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
  }

  uint32_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t n = 0;
    for (const auto& slot : slots_) {
      if (slot.fn != nullptr) ++n;
    }
    return n;
  }

 private:
  struct Slot {
    StatusCallback fn = nullptr;
    void* ctx = nullptr;
    uint32_t id = 0;
  };

  mutable std::mutex mutex_;
  Slot slots_[kMaxSubscribers];
  uint32_t next_id_ = 1;
  StatusSnapshot last_;
};

}  // namespace ts

#endif  // TS_STATUS_HPP_
