/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Child process handle used to run the media engine executable.
 *
 * Header-only, Linux-only (uses /proc and pipe2(2)).
 *
 * Features:
 *   - Subprocess spawn with optional merged stdout/stderr capture
 *   - Synchronous exec failure detection via a close-on-exec status pipe
 *   - Non-blocking TryWait() and bounded Wait()
 *   - /proc/<pid>/io byte counters
 */

#ifndef TS_PROCESS_HPP_
#define TS_PROCESS_HPP_

#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#if defined(TS_PLATFORM_LINUX)

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace ts {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,      ///< fork/pipe error or signal delivery failed
  kExecFailed = -2,  ///< Program not found or not executable
};

namespace detail {

/// @brief Sleep for @p ms milliseconds (nanosleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

/// @brief Read a /proc file into @p buf (NUL-terminated).
/// @return Bytes read, or -1 on error.
inline int ReadProcFile(const char* path, char* buf, size_t buf_size) {
  int fd = open(path, O_RDONLY | O_CLOEXEC);  // NOLINT
  if (fd < 0)
    return -1;
  ssize_t n = read(fd, buf, buf_size - 1);
  close(fd);  // NOLINT
  if (n < 0)
    return -1;
  buf[static_cast<size_t>(n)] = '\0';
  return static_cast<int>(n);
}

/// @brief Value of "key: N" in a /proc key-value file, or 0.
inline uint64_t FindProcCounter(const char* text, const char* key) {
  const size_t key_len = std::strlen(key);
  for (const char* line = text; line != nullptr && *line != '\0';) {
    if (std::strncmp(line, key, key_len) == 0 && line[key_len] == ':') {
      return std::strtoull(line + key_len + 1, nullptr, 10);
    }
    line = std::strchr(line, '\n');
    if (line != nullptr) ++line;
  }
  return 0;
}

// ============================================================================
// PipeGuard - RAII pipe pair
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @param flags pipe2(2) flags, e.g. O_CLOEXEC.
  bool Create(int flags = 0) { return pipe2(fd_, flags) == 0; }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);  // NOLINT
      fd_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);  // NOLINT
      fd_[1] = -1;
    }
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

}  // namespace detail

/// @brief True if @p pid exists and can receive signals.
inline bool IsProcessAlive(pid_t pid) {
  return pid > 0 && kill(pid, 0) == 0;
}

/// @brief Cumulative I/O of a process (/proc/<pid>/io).
struct ProcessIo {
  uint64_t rchar = 0;  ///< Bytes read through any syscall (sockets included).
  uint64_t wchar = 0;  ///< Bytes written through any syscall.
};

inline optional<ProcessIo> ReadProcessIo(pid_t pid) {
  char path[64];
  (void)snprintf(path, sizeof(path), "/proc/%d/io", static_cast<int>(pid));
  char buf[512];
  if (detail::ReadProcFile(path, buf, sizeof(buf)) < 0) {
    return {};
  }
  ProcessIo io;
  io.rchar = detail::FindProcCounter(buf, "rchar");
  io.wchar = detail::FindProcCounter(buf, "wchar");
  return optional<ProcessIo>(io);
}

// ============================================================================
// Subprocess
// ============================================================================

struct SubprocessConfig {
  const char* const* argv;  ///< NULL-terminated; argv[0] is looked up in PATH
  bool capture_output;      ///< stdout and stderr into one pipe

  SubprocessConfig() : argv(nullptr), capture_output(false) {}
};

struct WaitResult {
  bool exited;      ///< Normal exit
  int exit_code;    ///< Valid if exited
  bool signaled;    ///< Killed by a signal
  int term_signal;  ///< Valid if signaled
  bool timed_out;

  WaitResult()
      : exited(false), exit_code(-1), signaled(false), term_signal(0),
        timed_out(false) {}
};

/**
 * @brief Owning handle for one child process.
 *
 * The destructor SIGKILLs and reaps a child that is still running.
 * Not thread-safe: one thread drives a given handle.
 *
 * @code
 *   const char* argv[] = {"cvlc", "udp://@:8600", nullptr};
 *   ts::SubprocessConfig cfg;
 *   cfg.argv = argv;
 *   cfg.capture_output = true;
 *   ts::Subprocess proc;
 *   if (proc.Start(cfg) == ts::ProcessResult::kSuccess) { ... }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1), output_fd_(-1) {}

  ~Subprocess() { Reset(); }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept
      : pid_(other.pid_), output_fd_(other.output_fd_) {
    other.pid_ = -1;
    other.output_fd_ = -1;
  }

  Subprocess& operator=(Subprocess&& other) noexcept {
    if (this != &other) {
      Reset();
      pid_ = other.pid_;
      output_fd_ = other.output_fd_;
      other.pid_ = -1;
      other.output_fd_ = -1;
    }
    return *this;
  }

  /**
   * @brief Spawn the child.
   *
   * Returns only after exec has either succeeded or failed: the child
   * reports an exec errno through a close-on-exec pipe, so EOF on that
   * pipe means the new image is running.
   */
  ProcessResult Start(const SubprocessConfig& cfg) {
    if (cfg.argv == nullptr || cfg.argv[0] == nullptr || pid_ > 0)
      return ProcessResult::kFailed;

    detail::PipeGuard output_pipe;
    detail::PipeGuard status_pipe;
    if (cfg.capture_output && !output_pipe.Create(O_CLOEXEC))
      return ProcessResult::kFailed;
    if (!status_pipe.Create(O_CLOEXEC))
      return ProcessResult::kFailed;

    pid_t child = fork();
    if (child < 0)
      return ProcessResult::kFailed;

    if (child == 0) {
      // New session so terminal signals aimed at us do not reach the child.
      setsid();

      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);
      }

      if (cfg.capture_output) {
        dup2(output_pipe.WriteEnd(), STDOUT_FILENO);
        dup2(output_pipe.WriteEnd(), STDERR_FILENO);
      } else {
        int devnull = open("/dev/null", O_WRONLY);  // NOLINT
        if (devnull >= 0) {
          dup2(devnull, STDOUT_FILENO);
          dup2(devnull, STDERR_FILENO);
        }
      }

      execvp(cfg.argv[0], const_cast<char* const*>(cfg.argv));
      const int err = errno;
      (void)!write(status_pipe.WriteEnd(), &err, sizeof(err));
      _exit(127);
    }

    pid_ = child;
    status_pipe.CloseWrite();
    int child_errno = 0;
    ssize_t n;
    do {
      n = read(status_pipe.ReadEnd(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
      int status;
      waitpid(pid_, &status, 0);
      pid_ = -1;
      errno = child_errno;
      return ProcessResult::kExecFailed;
    }

    if (cfg.capture_output) {
      output_pipe.CloseWrite();
      output_fd_ = output_pipe.ReleaseRead();
      int flags = fcntl(output_fd_, F_GETFL, 0);
      if (flags >= 0) {
        fcntl(output_fd_, F_SETFL, flags | O_NONBLOCK);
      }
    }
    return ProcessResult::kSuccess;
  }

  /**
   * @brief Non-blocking read of captured output.
   * @return Bytes read, 0 when nothing is pending, -1 on EOF or error.
   */
  int ReadOutput(char* buf, size_t buf_size) {
    if (output_fd_ < 0 || buf_size == 0)
      return -1;
    ssize_t n = read(output_fd_, buf, buf_size);
    if (n < 0) {
      return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? 0
                                                                          : -1;
    }
    return (n == 0) ? -1 : static_cast<int>(n);
  }

  /// @brief Reap the child if it has exited; never blocks.
  optional<WaitResult> TryWait() {
    if (pid_ <= 0)
      return {};
    int status;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w <= 0)
      return {};
    WaitResult wr;
    FillWaitResult(status, wr);
    pid_ = -1;
    return optional<WaitResult>(wr);
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 waits forever.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.exited = true;
      return wr;
    }
    if (timeout_ms == 0) {
      int status;
      pid_t w;
      do {
        w = waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w > 0) {
        FillWaitResult(status, wr);
        pid_ = -1;
      }
      return wr;
    }

    constexpr uint32_t kPollIntervalMs = 5;
    for (uint32_t elapsed = 0; elapsed < timeout_ms;
         elapsed += kPollIntervalMs) {
      auto r = TryWait();
      if (r.has_value())
        return r.value();
      if (pid_ <= 0)
        break;
      detail::SleepMs(kPollIntervalMs);
    }
    wr.timed_out = true;
    return wr;
  }

  ProcessResult Signal(int signo) {
    if (pid_ <= 0)
      return ProcessResult::kFailed;
    return (kill(pid_, signo) == 0) ? ProcessResult::kSuccess
                                    : ProcessResult::kFailed;
  }

  /**
   * @brief SIGTERM, then SIGKILL after @p grace_ms, then reap.
   */
  WaitResult Terminate(uint32_t grace_ms) {
    if (pid_ <= 0) {
      WaitResult wr;
      wr.exited = true;
      return wr;
    }
    (void)Signal(SIGTERM);
    WaitResult wr = Wait(grace_ms);
    if (wr.timed_out) {
      (void)Signal(SIGKILL);
      wr = Wait(0);
    }
    return wr;
  }

  /// @brief Child PID, -1 if not started or already reaped.
  pid_t GetPid() const { return pid_; }

  bool IsRunning() const { return IsProcessAlive(pid_); }

 private:
  void Reset() {
    if (output_fd_ >= 0) {
      close(output_fd_);  // NOLINT
      output_fd_ = -1;
    }
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status;
      waitpid(pid_, &status, 0);
      pid_ = -1;
    }
  }

  static void FillWaitResult(int status, WaitResult& wr) {
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }

  pid_t pid_;
  int output_fd_;
};

}  // namespace ts

#endif  // defined(TS_PLATFORM_LINUX)

#endif  // TS_PROCESS_HPP_
