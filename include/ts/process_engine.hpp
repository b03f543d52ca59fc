/**
 * @file process_engine.hpp
 * @brief MediaEngine that runs the VLC command-line player as a child
 *        process.
 *
 * Lifecycle mapping:
 *   Play()                      -> opening
 *   child alive after settle_ms -> playing
 *   child exits on its own      -> error
 *   Stop()                      -> stopped
 *
 * Byte counters come from the child's /proc/<pid>/io: rchar as read bytes,
 * wchar as sent bytes.
 */

#ifndef TS_PROCESS_ENGINE_HPP_
#define TS_PROCESS_ENGINE_HPP_

#include "ts/log.hpp"
#include "ts/media_engine.hpp"
#include "ts/platform.hpp"
#include "ts/process.hpp"
#include "ts/vocabulary.hpp"

#if defined(TS_PLATFORM_LINUX)

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ts {

struct ProcessEngineOptions {
  std::string program = "cvlc";
  std::vector<std::string> extra_args;  ///< Inserted before the source URL.
  uint32_t settle_ms = 1500U;           ///< Alive this long => playing.
  uint32_t poll_ms = 50U;
  uint32_t stop_grace_ms = 2000U;       ///< SIGTERM -> SIGKILL delay.
};

/// @brief argv (without the trailing NULL) for one launch.
inline std::vector<std::string> BuildEngineCommand(
    const ProcessEngineOptions& opts, const EngineLaunchSpec& spec) {
  std::vector<std::string> argv;
  argv.push_back(opts.program);
  argv.emplace_back("--intf=dummy");
  for (const auto& o : spec.engine_options) argv.push_back(o);
  for (const auto& a : opts.extra_args) argv.push_back(a);
  argv.push_back(spec.source_url);
  for (const auto& o : spec.media_options) argv.push_back(o);
  return argv;
}

// ============================================================================
// ProcessMediaEngine
// ============================================================================

class ProcessMediaEngine final : public MediaEngine {
 public:
  explicit ProcessMediaEngine(ProcessEngineOptions opts)
      : opts_(std::move(opts)) {}

  ~ProcessMediaEngine() override { Stop(); }

  ProcessMediaEngine(const ProcessMediaEngine&) = delete;
  ProcessMediaEngine& operator=(const ProcessMediaEngine&) = delete;

  expected<void, EngineError> Open(const EngineLaunchSpec& spec,
                                   const EngineEventSink& sink) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (opened_) {
      return expected<void, EngineError>::error(EngineError::kAlreadyOpen);
    }
    argv_ = BuildEngineCommand(opts_, spec);
    sink_ = sink;
    opened_ = true;
    return expected<void, EngineError>::success();
  }

  expected<void, EngineError> Play() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
      return expected<void, EngineError>::error(EngineError::kNotOpen);
    }
    if (monitor_.joinable()) {
      return expected<void, EngineError>::error(EngineError::kAlreadyOpen);
    }

    std::vector<const char*> argv;
    argv.reserve(argv_.size() + 1U);
    for (const auto& a : argv_) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    SubprocessConfig cfg;
    cfg.argv = argv.data();
    cfg.capture_output = true;
    ProcessResult r = proc_.Start(cfg);
    if (r != ProcessResult::kSuccess) {
      TS_LOG_ERROR("Engine", "cannot launch %s: %s", argv_[0].c_str(),
                   r == ProcessResult::kExecFailed ? std::strerror(errno)
                                                   : "spawn failed");
      return expected<void, EngineError>::error(EngineError::kLaunchFailed);
    }
    pid_.store(proc_.GetPid(), std::memory_order_release);
    TS_LOG_INFO("Engine", "launched %s (pid %d)", argv_[0].c_str(),
                static_cast<int>(proc_.GetPid()));

    stop_requested_.store(false, std::memory_order_release);
    sink_.Emit(EngineEventType::kOpening);
    monitor_ = std::thread(&ProcessMediaEngine::MonitorLoop, this);
    return expected<void, EngineError>::success();
  }

  void Stop() override {
    std::thread monitor;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!monitor_.joinable()) return;
      stop_requested_.store(true, std::memory_order_release);
      monitor = std::move(monitor_);
    }
    monitor.join();
    sink_.Emit(EngineEventType::kStopped);
  }

  optional<EngineStats> ReadStats() override {
    const pid_t pid = pid_.load(std::memory_order_acquire);
    if (pid <= 0) return {};
    auto io = ReadProcessIo(pid);
    if (!io.has_value()) return {};
    EngineStats stats;
    stats.read_bytes = io.value().rchar;
    stats.sent_bytes = io.value().wchar;
    return optional<EngineStats>(stats);
  }

 private:
  /// Owns proc_ after Play(): drains output, detects exit, and on stop
  /// terminates and reaps the child.
  void MonitorLoop() {
    const auto started = std::chrono::steady_clock::now();
    bool playing = false;
    char buf[512];

    while (!stop_requested_.load(std::memory_order_acquire)) {
      DrainOutput(buf, sizeof(buf));

      auto exited = proc_.TryWait();
      if (exited.has_value()) {
        pid_.store(-1, std::memory_order_release);
        const WaitResult& wr = exited.value();
        if (wr.signaled) {
          TS_LOG_WARN("Engine", "engine killed by signal %d", wr.term_signal);
        } else {
          TS_LOG_WARN("Engine", "engine exited with code %d", wr.exit_code);
        }
        sink_.Emit(EngineEventType::kError);
        return;
      }

      if (!playing) {
        const auto alive = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (alive.count() >= static_cast<int64_t>(opts_.settle_ms)) {
          playing = true;
          sink_.Emit(EngineEventType::kPlaying);
        }
      }
      detail::SleepMs(opts_.poll_ms);
    }

    WaitResult wr = proc_.Terminate(opts_.stop_grace_ms);
    pid_.store(-1, std::memory_order_release);
    if (wr.signaled && wr.term_signal == SIGKILL) {
      TS_LOG_WARN("Engine", "engine ignored SIGTERM, killed");
    }
  }

  void DrainOutput(char* buf, size_t size) {
    for (;;) {
      int n = proc_.ReadOutput(buf, size - 1U);
      if (n <= 0) return;
      buf[n] = '\0';
      // Strip the trailing newline so log lines stay one per record.
      if (buf[n - 1] == '\n') buf[n - 1] = '\0';
      TS_LOG_DEBUG("Engine", "vlc: %s", buf);
    }
  }

  ProcessEngineOptions opts_;
  std::mutex mutex_;
  std::vector<std::string> argv_;
  EngineEventSink sink_;
  bool opened_ = false;
  Subprocess proc_;
  std::atomic<pid_t> pid_{-1};
  std::atomic<bool> stop_requested_{false};
  std::thread monitor_;
};

/// @brief Factory producing ProcessMediaEngine instances.
class ProcessMediaEngineFactory final : public MediaEngineFactory {
 public:
  explicit ProcessMediaEngineFactory(ProcessEngineOptions opts)
      : opts_(std::move(opts)) {}

  std::unique_ptr<MediaEngine> Create() override {
    return std::unique_ptr<MediaEngine>(new ProcessMediaEngine(opts_));
  }

 private:
  ProcessEngineOptions opts_;
};

}  // namespace ts

#endif  // defined(TS_PLATFORM_LINUX)

#endif  // TS_PROCESS_ENGINE_HPP_
