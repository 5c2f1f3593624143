/**
 * @file clipboard.hpp
 * @brief Clipboard access port and its command-line tool backends.
 *
 * The bridge core only sees ClipboardPort. CommandClipboard drives the
 * usual Wayland/X11 utilities in priority order; NullClipboard is the
 * no-backend fallback.
 */

#ifndef CLIPSYNC_CLIPBOARD_HPP_
#define CLIPSYNC_CLIPBOARD_HPP_

#include "clipsync/log.hpp"
#include "clipsync/process.hpp"
#include "clipsync/vocabulary.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace clipsync {

enum class ClipboardError : uint8_t {
  kNoBackend = 0,  ///< no reader tool installed
  kToolFailed,     ///< spawn failure or every reader exited non-zero
  kTimeout         ///< reader exceeded its deadline
};

inline const char* ClipboardErrorToString(ClipboardError e) noexcept {
  switch (e) {
    case ClipboardError::kNoBackend:  return "no backend";
    case ClipboardError::kToolFailed: return "tool failed";
    case ClipboardError::kTimeout:    return "timeout";
    default:                          return "unknown";
  }
}

// ============================================================================
// ClipboardPort
// ============================================================================

/**
 * @brief Text clipboard capability.
 *
 * Implementations must be callable from any thread and must not block
 * beyond the stated timeout. Success with an empty string is a valid
 * empty-clipboard result.
 */
class ClipboardPort {
 public:
  virtual ~ClipboardPort() = default;

  virtual expected<std::string, ClipboardError> ReadText(uint32_t timeout_ms) = 0;

  /** @brief Best effort; failures are logged by the implementation. */
  virtual bool WriteText(const std::string& text) = 0;
};

// ============================================================================
// NullClipboard
// ============================================================================

class NullClipboard final : public ClipboardPort {
 public:
  expected<std::string, ClipboardError> ReadText(uint32_t) override {
    return expected<std::string, ClipboardError>::error(
        ClipboardError::kNoBackend);
  }
  bool WriteText(const std::string&) override { return false; }
};

// ============================================================================
// CommandClipboard
// ============================================================================

/// @brief One external tool: executable name plus fixed arguments.
struct ClipboardTool {
  std::string name;
  std::vector<std::string> args;
};

inline std::vector<ClipboardTool> DefaultClipboardReaders() {
  return {
      {"wl-paste", {"--type", "text", "--no-newline"}},
      {"xclip", {"-selection", "clipboard", "-out"}},
      {"xsel", {"--clipboard", "--output"}},
  };
}

inline std::vector<ClipboardTool> DefaultClipboardWriters() {
  return {
      {"wl-copy", {"--type", "text"}},
      {"xclip", {"-selection", "clipboard", "-in"}},
      {"xsel", {"--clipboard", "--input"}},
  };
}

/**
 * @brief ClipboardPort backed by external utilities.
 *
 * Tool paths are resolved through PATH on first use and cached for the
 * lifetime of the object.
 */
class CommandClipboard final : public ClipboardPort {
 public:
  static constexpr uint32_t kWriteTimeoutMs = 1000U;

  CommandClipboard()
      : readers_(DefaultClipboardReaders()),
        writers_(DefaultClipboardWriters()),
        resolved_(false),
        warned_no_reader_(false) {}

  CommandClipboard(std::vector<ClipboardTool> readers,
                   std::vector<ClipboardTool> writers)
      : readers_(std::move(readers)),
        writers_(std::move(writers)),
        resolved_(false),
        warned_no_reader_(false) {}

  /**
   * @brief Run readers in priority order.
   *
   * The first tool exiting 0 wins. A non-zero exit falls through to the
   * next tool; a spawn failure or timeout ends the read.
   */
  expected<std::string, ClipboardError> ReadText(uint32_t timeout_ms) override {
    using Result = expected<std::string, ClipboardError>;
    std::vector<std::vector<std::string>> cmds;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Resolve();
      cmds = reader_cmds_;
      if (cmds.empty()) {
        if (!warned_no_reader_) {
          CLIPSYNC_LOG_WARN("Clipboard", "No clipboard reader available");
          warned_no_reader_ = true;
        }
        return Result::error(ClipboardError::kNoBackend);
      }
    }
    for (const auto& argv : cmds) {
      auto r = RunTool(argv, std::string(), timeout_ms, true);
      if (!r.has_value()) {
        CLIPSYNC_LOG_DEBUG("Clipboard", "%s read failed: %s", argv[0].c_str(),
                           ProcessErrorToString(r.get_error()));
        return Result::error(r.get_error() == ProcessError::kTimeout
                                 ? ClipboardError::kTimeout
                                 : ClipboardError::kToolFailed);
      }
      if (r.value().exit_code == 0) {
        return Result::success(std::move(r.value().output));
      }
    }
    return Result::error(ClipboardError::kToolFailed);
  }

  bool WriteText(const std::string& text) override {
    std::vector<std::vector<std::string>> cmds;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Resolve();
      cmds = writer_cmds_;
    }
    for (const auto& argv : cmds) {
      auto r = RunTool(argv, text, kWriteTimeoutMs, false);
      if (r.has_value() && r.value().exit_code == 0) {
        return true;
      }
      if (r.has_value()) {
        CLIPSYNC_LOG_DEBUG("Clipboard", "%s write failed: exit %d",
                           argv[0].c_str(), r.value().exit_code);
      } else {
        CLIPSYNC_LOG_DEBUG("Clipboard", "%s write failed: %s", argv[0].c_str(),
                           ProcessErrorToString(r.get_error()));
      }
    }
    CLIPSYNC_LOG_WARN("Clipboard", "No clipboard writer available");
    return false;
  }

  /** @brief Names of reader tools found on this machine, in priority order. */
  std::vector<std::string> AvailableReaders() {
    std::lock_guard<std::mutex> lock(mutex_);
    Resolve();
    std::vector<std::string> names;
    for (const auto& argv : reader_cmds_) names.push_back(argv[0]);
    return names;
  }

 private:
  static std::vector<std::vector<std::string>> ResolveTools(
      const std::vector<ClipboardTool>& tools) {
    std::vector<std::vector<std::string>> out;
    for (const auto& t : tools) {
      auto path = FindInPath(t.name);
      if (!path.has_value()) continue;
      std::vector<std::string> argv;
      argv.push_back(path.value());
      argv.insert(argv.end(), t.args.begin(), t.args.end());
      out.push_back(std::move(argv));
    }
    return out;
  }

  // Caller holds mutex_.
  void Resolve() {
    if (resolved_) return;
    reader_cmds_ = ResolveTools(readers_);
    writer_cmds_ = ResolveTools(writers_);
    resolved_ = true;
    CLIPSYNC_LOG_DEBUG("Clipboard", "resolved %zu reader(s), %zu writer(s)",
                       reader_cmds_.size(), writer_cmds_.size());
  }

  std::vector<ClipboardTool> readers_;
  std::vector<ClipboardTool> writers_;
  std::vector<std::vector<std::string>> reader_cmds_;
  std::vector<std::vector<std::string>> writer_cmds_;
  std::mutex mutex_;
  bool resolved_;
  bool warned_no_reader_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_CLIPBOARD_HPP_
