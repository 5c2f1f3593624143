/**
 * @file test_process.cpp
 * @brief Tests for process.hpp
 */

#include "clipsync/process.hpp"

#include <signal.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

// ============================================================================
// FindInPath
// ============================================================================

TEST_CASE("FindInPath resolves sh", "[process]") {
  auto path = clipsync::FindInPath("sh");
  REQUIRE(path.has_value());
  REQUIRE(path.value().find("/sh") != std::string::npos);
}

TEST_CASE("FindInPath returns empty for unknown tool", "[process]") {
  REQUIRE(!clipsync::FindInPath("__clipsync_no_such_tool__").has_value());
  REQUIRE(!clipsync::FindInPath("").has_value());
}

TEST_CASE("FindInPath checks names with a slash as given", "[process]") {
  REQUIRE(clipsync::FindInPath("/bin/sh").has_value());
  REQUIRE(!clipsync::FindInPath("/nonexistent/dir/sh").has_value());
}

// ============================================================================
// RunTool
// ============================================================================

TEST_CASE("RunTool captures stdout", "[process]") {
  auto r = clipsync::RunTool({"echo", "hello clipsync"}, "", 2000, true);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 0);
  REQUIRE(r.value().output == "hello clipsync\n");
}

TEST_CASE("RunTool feeds stdin and closes it", "[process]") {
  auto r = clipsync::RunTool({"cat"}, "piped text", 2000, true);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 0);
  REQUIRE(r.value().output == "piped text");
}

TEST_CASE("RunTool handles stdin larger than a pipe buffer", "[process]") {
  std::string big(256 * 1024, 'q');
  auto r = clipsync::RunTool({"cat"}, big, 5000, true);
  REQUIRE(r.has_value());
  REQUIRE(r.value().output.size() == big.size());
}

TEST_CASE("RunTool without capture discards output", "[process]") {
  auto r = clipsync::RunTool({"echo", "ignored"}, "", 2000, false);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 0);
  REQUIRE(r.value().output.empty());
}

TEST_CASE("RunTool reports nonzero exit code", "[process]") {
  auto r = clipsync::RunTool({"sh", "-c", "exit 3"}, "", 2000, true);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 3);
}

TEST_CASE("RunTool nonexistent command exits 127", "[process]") {
  auto r = clipsync::RunTool({"__clipsync_no_such_tool__"}, "", 2000, true);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("RunTool kills a child past its deadline", "[process]") {
  const uint64_t start = clipsync::SteadyNowMs();
  auto r = clipsync::RunTool({"sleep", "10"}, "", 100, false);
  const uint64_t elapsed = clipsync::SteadyNowMs() - start;
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ProcessError::kTimeout);
  REQUIRE(elapsed < 5000U);
}

TEST_CASE("RunTool survives a child that ignores stdin", "[process]") {
  // The child exits without reading: the write side sees EPIPE, not SIGPIPE.
  std::string payload(128 * 1024, 'z');
  auto r = clipsync::RunTool({"true"}, payload, 2000, false);
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 0);

  sigset_t pending;
  sigemptyset(&pending);
  REQUIRE(sigpending(&pending) == 0);
  REQUIRE(sigismember(&pending, SIGPIPE) == 0);
}

TEST_CASE("RunTool rejects empty argv", "[process]") {
  auto r = clipsync::RunTool({}, "", 100, false);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ProcessError::kSpawnFailed);
}

TEST_CASE("detail::SleepMs does not crash", "[process]") {
  clipsync::detail::SleepMs(1);
  REQUIRE(std::string(clipsync::ProcessErrorToString(
              clipsync::ProcessError::kTimeout)) == "timeout");
}
