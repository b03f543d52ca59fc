/**
 * @file media_engine.hpp
 * @brief Boundary to the external media engine: an opaque unit that takes a
 *        source URL, a sink spec and options, and reports lifecycle events
 *        plus cumulative byte counters.
 */

#ifndef TS_MEDIA_ENGINE_HPP_
#define TS_MEDIA_ENGINE_HPP_

#include "ts/bandwidth.hpp"
#include "ts/platform.hpp"
#include "ts/stream_config.hpp"
#include "ts/vocabulary.hpp"

#include <memory>

namespace ts {

// ============================================================================
// Events
// ============================================================================

enum class EngineEventType : uint8_t {
  kOpening = 0,
  kBuffering,
  kPlaying,
  kError,
  kStopped
};

inline const char* EngineEventName(EngineEventType t) noexcept {
  switch (t) {
    case EngineEventType::kOpening:   return "opening";
    case EngineEventType::kBuffering: return "buffering";
    case EngineEventType::kPlaying:   return "playing";
    case EngineEventType::kError:     return "error";
    case EngineEventType::kStopped:   return "stopped";
  }
  return "unknown";
}

struct EngineEvent {
  EngineEventType type;
  uint8_t buffering_percent;  ///< Meaningful for kBuffering only.
};

using EngineEventFn = void (*)(const EngineEvent& event, void* ctx);

/// @brief Where an engine delivers its events. May be called from any
///        engine-owned thread.
struct EngineEventSink {
  EngineEventFn fn = nullptr;
  void* ctx = nullptr;

  void Emit(EngineEventType type, uint8_t percent = 0) const {
    if (fn != nullptr) {
      fn(EngineEvent{type, percent}, ctx);
    }
  }
};

// ============================================================================
// MediaEngine
// ============================================================================

enum class EngineError : uint8_t {
  kAlreadyOpen = 0,
  kNotOpen,
  kLaunchFailed,
};

/**
 * @brief One engine instance serves one session attempt.
 *
 * Open() prepares the instance, Play() starts ingest and serving, Stop()
 * tears everything down and must not return while engine threads may still
 * emit events. Destroying an instance implies Stop().
 */
class MediaEngine {
 public:
  virtual ~MediaEngine() = default;

  virtual expected<void, EngineError> Open(const EngineLaunchSpec& spec,
                                           const EngineEventSink& sink) = 0;
  virtual expected<void, EngineError> Play() = 0;
  virtual void Stop() = 0;

  /// @brief Cumulative counters, or empty when not available right now.
  virtual optional<EngineStats> ReadStats() = 0;
};

/// @brief Creates fresh engine instances (one per start or reconnect).
class MediaEngineFactory {
 public:
  virtual ~MediaEngineFactory() = default;

  /// @return nullptr when no instance can be created.
  virtual std::unique_ptr<MediaEngine> Create() = 0;
};

}  // namespace ts

#endif  // TS_MEDIA_ENGINE_HPP_
