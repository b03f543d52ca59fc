/**
 * @file test_process.cpp
 * @brief Tests for process.hpp
 */

#include "ts/process.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <string>

namespace {

std::string DrainOutput(ts::Subprocess& proc) {
  std::string out;
  char buf[256];
  for (int i = 0; i < 400; ++i) {
    int n = proc.ReadOutput(buf, sizeof(buf));
    if (n < 0) break;
    if (n == 0) {
      ts::detail::SleepMs(5);
      continue;
    }
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

}  // namespace

TEST_CASE("Subprocess captures output and exit code", "[process]") {
  const char* argv[] = {"/bin/sh", "-c", "echo hello; exit 3", nullptr};
  ts::SubprocessConfig cfg;
  cfg.argv = argv;
  cfg.capture_output = true;

  ts::Subprocess proc;
  REQUIRE(proc.Start(cfg) == ts::ProcessResult::kSuccess);
  REQUIRE(proc.GetPid() > 0);
  REQUIRE(DrainOutput(proc) == "hello\n");

  auto wr = proc.Wait(2000);
  REQUIRE(wr.exited);
  REQUIRE(wr.exit_code == 3);
  REQUIRE(proc.GetPid() == -1);
}

TEST_CASE("Subprocess reports a missing program", "[process]") {
  const char* argv[] = {"/nonexistent/tetherstream-engine", nullptr};
  ts::SubprocessConfig cfg;
  cfg.argv = argv;
  ts::Subprocess proc;
  REQUIRE(proc.Start(cfg) == ts::ProcessResult::kExecFailed);
  REQUIRE(proc.GetPid() == -1);
}

TEST_CASE("Subprocess rejects an empty argv", "[process]") {
  ts::SubprocessConfig cfg;
  ts::Subprocess proc;
  REQUIRE(proc.Start(cfg) == ts::ProcessResult::kFailed);
}

TEST_CASE("Subprocess Terminate stops a long-running child", "[process]") {
  const char* argv[] = {"/bin/sh", "-c", "sleep 30", nullptr};
  ts::SubprocessConfig cfg;
  cfg.argv = argv;
  ts::Subprocess proc;
  REQUIRE(proc.Start(cfg) == ts::ProcessResult::kSuccess);
  REQUIRE(proc.IsRunning());
  REQUIRE_FALSE(proc.TryWait().has_value());

  auto wr = proc.Terminate(1000);
  REQUIRE_FALSE(wr.timed_out);
  REQUIRE(wr.signaled);
  REQUIRE(proc.GetPid() == -1);
}

TEST_CASE("Subprocess Wait times out on a busy child", "[process]") {
  const char* argv[] = {"/bin/sh", "-c", "sleep 30", nullptr};
  ts::SubprocessConfig cfg;
  cfg.argv = argv;
  ts::Subprocess proc;
  REQUIRE(proc.Start(cfg) == ts::ProcessResult::kSuccess);
  auto wr = proc.Wait(30);
  REQUIRE(wr.timed_out);
  REQUIRE(proc.Signal(SIGKILL) == ts::ProcessResult::kSuccess);
  wr = proc.Wait(0);
  REQUIRE(wr.signaled);
  REQUIRE(wr.term_signal == SIGKILL);
}

TEST_CASE("ReadProcessIo reads the calling process", "[process]") {
  auto io = ts::ReadProcessIo(::getpid());
  if (!io.has_value()) {
    SKIP("/proc/<pid>/io not readable here");
  }
  REQUIRE(io.value().rchar > 0U);
  REQUIRE_FALSE(ts::ReadProcessIo(-1).has_value());
}

TEST_CASE("FindProcCounter parses key-value text", "[process]") {
  const char* text = "rchar: 1234\nwchar: 56\nsyscr: 7\n";
  REQUIRE(ts::detail::FindProcCounter(text, "rchar") == 1234U);
  REQUIRE(ts::detail::FindProcCounter(text, "wchar") == 56U);
  REQUIRE(ts::detail::FindProcCounter(text, "read_bytes") == 0U);
}
