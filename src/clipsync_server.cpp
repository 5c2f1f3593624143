/**
 * @file clipsync_server.cpp
 * @brief Clipboard bridge server executable.
 *
 * Usage: clipsync_server [--config FILE] [--host ADDR] [--port N]
 *                        [--poll-ms N] [--log-level LEVEL]
 */

#include "clipsync/bridge_server.hpp"
#include "clipsync/clipboard.hpp"
#include "clipsync/config.hpp"
#include "clipsync/log.hpp"
#include "clipsync/shutdown.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace {

struct Options {
  const char* config_path = nullptr;
  const char* host = nullptr;
  const char* log_level = nullptr;
  long port = -1;
  long poll_ms = -1;
};

void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "Usage: %s [options]\n"
               "  -c, --config FILE      INI file ([server], [log] sections)\n"
               "  -H, --host ADDR        bind address (default 0.0.0.0)\n"
               "  -p, --port N           bind port (default 28900)\n"
               "  -i, --poll-ms N        clipboard poll interval, min 50 (default 300)\n"
               "  -l, --log-level LEVEL  debug|info|warn|error|off\n"
               "  -h, --help             show this help\n",
               prog);
}

bool ParseLong(const char* text, long lo, long hi, long& out) {
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v < lo || v > hi) {
    return false;
  }
  out = v;
  return true;
}

/// Value following argv[i], or nullptr (with a message) when it is missing.
const char* TakeValue(int argc, char* argv[], int& i) {
  if (i + 1 >= argc) {
    std::fprintf(stderr, "missing value for %s\n", argv[i]);
    return nullptr;
  }
  return argv[++i];
}

// Returns 0 to continue, otherwise the exit code.
int ParseArgs(int argc, char* argv[], Options& opts) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
      PrintUsage(argv[0]);
      return -1;
    }
    if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
      if ((opts.config_path = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-H") == 0 || std::strcmp(arg, "--host") == 0) {
      if ((opts.host = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--log-level") == 0) {
      if ((opts.log_level = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-p") == 0 || std::strcmp(arg, "--port") == 0) {
      const char* v = TakeValue(argc, argv, i);
      if (v == nullptr) return 2;
      if (!ParseLong(v, 0, 65535, opts.port)) {
        std::fprintf(stderr, "invalid --port: %s\n", v);
        return 2;
      }
    } else if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--poll-ms") == 0) {
      const char* v = TakeValue(argc, argv, i);
      if (v == nullptr) return 2;
      if (!ParseLong(v, 0, 3600000, opts.poll_ms)) {
        std::fprintf(stderr, "invalid --poll-ms: %s\n", v);
        return 2;
      }
    } else {
      std::fprintf(stderr, "unexpected argument: %s\n", arg);
      PrintUsage(argv[0]);
      return 2;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  int rc = ParseArgs(argc, argv, opts);
  if (rc != 0) {
    return rc < 0 ? 0 : rc;
  }

  clipsync::log::Init();

  clipsync::ServerConfig cfg;
  if (opts.config_path != nullptr) {
    clipsync::ConfigStore store;
    auto loaded = store.LoadFile(opts.config_path);
    if (!loaded.has_value()) {
      CLIPSYNC_LOG_ERROR("Main", "Cannot load %s: %s (line %d)", opts.config_path,
                         clipsync::ConfigErrorToString(loaded.get_error()),
                         store.ErrorLine());
      return 1;
    }
    if (!clipsync::LoadServerConfig(store, cfg).has_value() ||
        !clipsync::LoadLogConfig(store).has_value()) {
      return 1;
    }
  }
  if (opts.host != nullptr) cfg.host = opts.host;
  if (opts.port >= 0) cfg.port = static_cast<uint16_t>(opts.port);
  if (opts.poll_ms >= 0) cfg.poll_interval_ms = static_cast<uint32_t>(opts.poll_ms);
  if (opts.log_level != nullptr) {
    clipsync::log::Level level;
    if (!clipsync::log::ParseLevel(opts.log_level, level)) {
      std::fprintf(stderr, "invalid --log-level: %s\n", opts.log_level);
      return 2;
    }
    clipsync::log::SetLevel(level);
  }

  CLIPSYNC_LOG_INFO("Main", "Starting clipsync server on %s:%u (poll=%ums)",
                    cfg.host.c_str(), static_cast<unsigned>(cfg.port),
                    cfg.poll_interval_ms);

  clipsync::CommandClipboard clipboard;
  clipsync::BridgeServer server(cfg, clipboard);
  auto opened = server.Open();
  if (!opened.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Cannot start server: %s",
                       clipsync::ServerErrorToString(opened.get_error()));
    return 1;
  }

  clipsync::ShutdownManager shutdown;
  auto reg = shutdown.Register([&server](int signo) {
    CLIPSYNC_LOG_INFO("Main", "Interrupted (signal %d), shutting down", signo);
    server.Shutdown();
  });
  auto installed = shutdown.InstallSignalHandlers();
  if (!reg.has_value() || !installed.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Cannot install signal handlers");
    return 1;
  }

  auto started = server.Start();
  if (!started.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Cannot start event loop: %s",
                       clipsync::ServerErrorToString(started.get_error()));
    return 1;
  }
  shutdown.WaitForShutdown();
  clipsync::log::Shutdown();
  return 0;
}
