/**
 * @file test_clipboard.cpp
 * @brief Tests for clipboard.hpp: NullClipboard, CommandClipboard with
 *        stand-in shell tools.
 */

#include <catch2/catch_test_macros.hpp>
#include "clipsync/clipboard.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {

std::string MakeTempPath() {
  char path[] = "/tmp/clipsync_clipboard_XXXXXX";
  int fd = ::mkstemp(path);
  REQUIRE(fd >= 0);
  ::close(fd);
  return std::string(path);
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

// ============================================================================
// NullClipboard
// ============================================================================

TEST_CASE("clipboard - NullClipboard has no backend", "[clipboard]") {
  clipsync::NullClipboard clip;
  auto r = clip.ReadText(100);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ClipboardError::kNoBackend);
  REQUIRE(!clip.WriteText("anything"));
}

// ============================================================================
// CommandClipboard read
// ============================================================================

TEST_CASE("clipboard - default tool tables in priority order", "[clipboard]") {
  auto readers = clipsync::DefaultClipboardReaders();
  REQUIRE(readers.size() == 3U);
  REQUIRE(readers[0].name == "wl-paste");
  REQUIRE(readers[1].name == "xclip");
  REQUIRE(readers[2].name == "xsel");

  auto writers = clipsync::DefaultClipboardWriters();
  REQUIRE(writers.size() == 3U);
  REQUIRE(writers[0].name == "wl-copy");
}

TEST_CASE("clipboard - read returns first successful tool output", "[clipboard]") {
  clipsync::CommandClipboard clip(
      {{"sh", {"-c", "printf hello"}}, {"sh", {"-c", "printf second"}}}, {});
  auto r = clip.ReadText(2000);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == "hello");
}

TEST_CASE("clipboard - read keeps output bytes untrimmed", "[clipboard]") {
  clipsync::CommandClipboard clip({{"sh", {"-c", "printf '  two\\nlines\\n'"}}}, {});
  auto r = clip.ReadText(2000);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == "  two\nlines\n");
}

TEST_CASE("clipboard - empty clipboard is a successful empty read", "[clipboard]") {
  clipsync::CommandClipboard clip({{"true", {}}}, {});
  auto r = clip.ReadText(2000);
  REQUIRE(r.has_value());
  REQUIRE(r.value().empty());
}

TEST_CASE("clipboard - failing reader falls through to the next", "[clipboard]") {
  clipsync::CommandClipboard clip(
      {{"sh", {"-c", "exit 1"}}, {"sh", {"-c", "printf fallback"}}}, {});
  auto r = clip.ReadText(2000);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == "fallback");
}

TEST_CASE("clipboard - every reader failing is kToolFailed", "[clipboard]") {
  clipsync::CommandClipboard clip({{"false", {}}}, {});
  auto r = clip.ReadText(2000);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ClipboardError::kToolFailed);
}

TEST_CASE("clipboard - slow reader times out", "[clipboard]") {
  clipsync::CommandClipboard clip({{"sleep", {"5"}}}, {});
  auto r = clip.ReadText(100);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ClipboardError::kTimeout);
}

TEST_CASE("clipboard - missing tools mean no backend", "[clipboard]") {
  clipsync::CommandClipboard clip({{"__clipsync_no_reader__", {}}},
                                  {{"__clipsync_no_writer__", {}}});
  REQUIRE(clip.AvailableReaders().empty());
  auto r = clip.ReadText(100);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ClipboardError::kNoBackend);
  // Second call stays quiet but still fails the same way.
  REQUIRE(clip.ReadText(100).get_error() == clipsync::ClipboardError::kNoBackend);
  REQUIRE(!clip.WriteText("x"));
}

TEST_CASE("clipboard - AvailableReaders lists resolved tools", "[clipboard]") {
  clipsync::CommandClipboard clip(
      {{"__clipsync_no_reader__", {}}, {"sh", {"-c", "true"}}}, {});
  auto names = clip.AvailableReaders();
  REQUIRE(names.size() == 1U);
  REQUIRE(names[0].find("/sh") != std::string::npos);
}

// ============================================================================
// CommandClipboard write
// ============================================================================

TEST_CASE("clipboard - write pipes text to the tool's stdin", "[clipboard]") {
  const std::string path = MakeTempPath();
  clipsync::CommandClipboard clip({}, {{"sh", {"-c", "cat > " + path}}});
  REQUIRE(clip.WriteText("copied text"));
  REQUIRE(ReadFile(path) == "copied text");
  ::unlink(path.c_str());
}

TEST_CASE("clipboard - failing writer falls through to the next", "[clipboard]") {
  const std::string path = MakeTempPath();
  clipsync::CommandClipboard clip(
      {}, {{"false", {}}, {"sh", {"-c", "cat > " + path}}});
  REQUIRE(clip.WriteText("second writer"));
  REQUIRE(ReadFile(path) == "second writer");
  ::unlink(path.c_str());
}

TEST_CASE("clipboard - write fails when every writer fails", "[clipboard]") {
  clipsync::CommandClipboard clip({}, {{"false", {}}});
  REQUIRE(!clip.WriteText("lost"));
}
