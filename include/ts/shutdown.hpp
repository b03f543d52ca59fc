/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM driven shutdown for the command-line front end.
 *
 * The signal handler only sets a flag and writes one byte to a self-pipe;
 * WaitForShutdown() blocks on the read end and then runs the registered
 * cleanup callbacks in LIFO order on the waiting thread.
 */

#ifndef TS_SHUTDOWN_HPP_
#define TS_SHUTDOWN_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

namespace ts {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @param signo Signal that triggered shutdown, 0 for Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may own the signal handlers per process.
inline ShutdownManager*& ShutdownInstance() noexcept {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Usage:
 * @code
 *   ts::ShutdownManager mgr;
 *   mgr.Register(StopSession, &controller);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8U;

  ShutdownManager() noexcept {
    if (detail::ShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe2(pipe_fd_, O_CLOEXEC) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::ShutdownInstance() == this) {
      detail::ShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  /// @brief False when another instance already existed or pipe2 failed.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kCallbacksFull);
    }
    entries_[count_].fn = fn;
    entries_[count_].ctx = ctx;
    ++count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown from code (first call wins).
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /// @brief Block until Quit() or a signal, then run callbacks LIFO once.
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0) {
      uint8_t byte = 0;
      while (!flag_.load(std::memory_order_acquire)) {
        ssize_t n = ::read(pipe_fd_[0], &byte, 1);
        if (n < 0 && errno != EINTR) break;
      }
    }
    if (ran_) return;
    ran_ = true;
    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = count_; i > 0U; --i) {
      entries_[i - 1U].fn(signo, entries_[i - 1U].ctx);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return flag_.load(std::memory_order_acquire);
  }

 private:
  struct Entry {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::ShutdownInstance();
    if (self != nullptr) {
      self->signo_.store(signo, std::memory_order_relaxed);
      self->flag_.store(true, std::memory_order_release);
      self->Wake();
    }
  }

  // Async-signal-safe.
  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      ssize_t n = ::write(pipe_fd_[1], &byte, 1);
      (void)n;
    }
  }

  Entry entries_[kMaxCallbacks];
  uint32_t count_ = 0U;
  std::atomic<bool> flag_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  bool valid_ = false;
  bool ran_ = false;
};

}  // namespace ts

#endif  // TS_SHUTDOWN_HPP_
