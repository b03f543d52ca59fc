/**
 * @file bandwidth.hpp
 * @brief Smoothed ingest bandwidth from cumulative engine byte counters.
 *
 * Single-owner, not thread-safe: the supervisor feeds it from its loop
 * thread only.
 */

#ifndef TS_BANDWIDTH_HPP_
#define TS_BANDWIDTH_HPP_

#include "ts/platform.hpp"

#include <cstdint>

namespace ts {

/// @brief Cumulative counters reported by the media engine.
struct EngineStats {
  uint64_t read_bytes = 0;        ///< Bytes read from the input.
  uint64_t demux_read_bytes = 0;  ///< Bytes consumed by the demuxer.
  uint64_t sent_bytes = 0;        ///< Bytes sent to viewers.
};

/// @brief Most meaningful non-zero counter: read, then demuxed, then sent.
inline uint64_t PickByteCounter(const EngineStats& stats) noexcept {
  if (stats.read_bytes > 0U) return stats.read_bytes;
  if (stats.demux_read_bytes > 0U) return stats.demux_read_bytes;
  if (stats.sent_bytes > 0U) return stats.sent_bytes;
  return 0U;
}

// ============================================================================
// BandwidthEstimator
// ============================================================================

/**
 * @brief Moving average over the last kWindow instantaneous rates.
 *
 * A sample is taken only when time advanced and both the baseline and the
 * new reading are non-zero. A counter that went backwards (engine rebuilt)
 * contributes no sample. The baseline always moves to the latest reading.
 */
class BandwidthEstimator final {
 public:
  static constexpr uint32_t kWindow = 5U;

  BandwidthEstimator() noexcept { Reset(0U); }

  /// @brief Clear samples; @p now_ms becomes the baseline time.
  void Reset(uint64_t now_ms) noexcept {
    for (uint32_t i = 0; i < kWindow; ++i) {
      samples_[i] = 0U;
    }
    next_ = 0U;
    count_ = 0U;
    last_bytes_ = 0U;
    last_ms_ = now_ms;
    current_ = 0U;
  }

  /**
   * @brief Feed one cumulative reading.
   * @return The smoothed rate in bytes per second after this reading.
   */
  uint64_t Update(uint64_t now_ms, uint64_t cumulative_bytes) noexcept {
    const bool time_advanced = now_ms > last_ms_;
    if (time_advanced && last_bytes_ > 0U && cumulative_bytes > 0U &&
        cumulative_bytes >= last_bytes_) {
      const uint64_t rate =
          (cumulative_bytes - last_bytes_) * kMsPerSecond / (now_ms - last_ms_);
      samples_[next_] = rate;
      next_ = (next_ + 1U) % kWindow;
      if (count_ < kWindow) ++count_;
      uint64_t sum = 0U;
      for (uint32_t i = 0; i < count_; ++i) {
        sum += samples_[i];
      }
      current_ = sum / count_;
    }
    last_bytes_ = cumulative_bytes;
    last_ms_ = now_ms;
    return current_;
  }

  uint64_t Update(uint64_t now_ms, const EngineStats& stats) noexcept {
    return Update(now_ms, PickByteCounter(stats));
  }

  uint64_t Current() const noexcept { return current_; }
  uint32_t SampleCount() const noexcept { return count_; }

 private:
  uint64_t samples_[kWindow];
  uint32_t next_;
  uint32_t count_;
  uint64_t last_bytes_;
  uint64_t last_ms_;
  uint64_t current_;
};

}  // namespace ts

#endif  // TS_BANDWIDTH_HPP_
