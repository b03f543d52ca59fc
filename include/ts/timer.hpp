/**
 * @file timer.hpp
 * @brief Fixed-capacity periodic and one-shot timer scheduler.
 *
 * One background thread scans the slot table and fires due tasks. Tasks
 * fire with the scheduler mutex held, so once Remove() returns the task's
 * callback is guaranteed not to be running and never runs again.
 * Consequently a callback must not call back into the scheduler; the
 * supervisor's callbacks only post an event and return.
 */

#ifndef TS_TIMER_HPP_
#define TS_TIMER_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace ts {

/// @param ctx User-supplied opaque pointer (may be nullptr).
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Timer scheduler with MaxTasks pre-allocated slots.
 *
 * Typical usage:
 *
 *   ts::TimerScheduler<4> sched;
 *   sched.Start();
 *   auto tick = sched.Add(1000, OnTick, this);
 *   auto once = sched.AddOneShot(3000, OnRetry, this);
 *   ...
 *   sched.Remove(tick.value());
 *
 * Non-copyable, non-movable.
 */
template <uint32_t MaxTasks = 8>
class TimerScheduler final {
 public:
  TimerScheduler() = default;
  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Register a task firing every @p period_ms.
   * @return kInvalidPeriod for 0, kSlotsFull when no slot is free.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    return Insert(period_ms, fn, ctx, false);
  }

  /// @brief Register a task firing once, @p delay_ms from now.
  expected<TimerTaskId, TimerError> AddOneShot(uint32_t delay_ms,
                                               TimerTaskFn fn,
                                               void* ctx = nullptr) {
    return Insert(delay_ms, fn, ctx, true);
  }

  /**
   * @brief Cancel a task. Blocks while its callback is running.
   * @return kNotRunning when the id is unknown or a one-shot already fired.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    bool expected_running = false;
    if (!running_.compare_exchange_strong(expected_running, true,
                                          std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// @brief Stop and join the scheduler thread. Safe when not running.
  void Stop() {
    running_.store(false, std::memory_order_release);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ns = 0;
    uint64_t next_fire_ns = 0;
    uint32_t id = 0;
    bool active = false;
    bool one_shot = false;
  };

  expected<TimerTaskId, TimerError> Insert(uint32_t ms, TimerTaskFn fn,
                                           void* ctx, bool one_shot) {
    if (ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active) continue;
      const uint64_t period_ns = static_cast<uint64_t>(ms) * 1000000ULL;
      slot.fn = fn;
      slot.ctx = ctx;
      slot.period_ns = period_ns;
      slot.next_fire_ns = NowNs() + period_ns;
      slot.id = next_id_++;
      slot.one_shot = one_shot;
      slot.active = true;
      return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /// Fires due slots, then sleeps half the shortest remaining time,
  /// clamped to [1 ms, 10 ms].
  void ScheduleLoop() {
    while (running_.load(std::memory_order_acquire)) {
      uint64_t min_remaining = UINT64_MAX;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t now = NowNs();
        for (auto& slot : slots_) {
          if (!slot.active) continue;
          if (now >= slot.next_fire_ns) {
            slot.fn(slot.ctx);
            if (slot.one_shot) {
              slot.active = false;
              continue;
            }
            slot.next_fire_ns += slot.period_ns;
            while (slot.next_fire_ns <= now) {
              slot.next_fire_ns += slot.period_ns;
            }
          }
          const uint64_t after = NowNs();
          const uint64_t remaining =
              (slot.next_fire_ns > after) ? (slot.next_fire_ns - after) : 0U;
          if (remaining < min_remaining) min_remaining = remaining;
        }
      }

      uint64_t sleep_ns =
          (min_remaining == UINT64_MAX) ? 10000000ULL : (min_remaining / 2U);
      if (sleep_ns < 1000000ULL) sleep_ns = 1000000ULL;
      if (sleep_ns > 10000000ULL) sleep_ns = 10000000ULL;
      std::this_thread::sleep_for(std::chrono::nanoseconds(sleep_ns));
    }
  }

  static uint64_t NowNs() noexcept {
    const auto dur = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
  }

  TaskSlot slots_[MaxTasks];
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
};

}  // namespace ts

#endif  // TS_TIMER_HPP_
