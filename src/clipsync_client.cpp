/**
 * @file clipsync_client.cpp
 * @brief Clipboard bridge peer executable.
 *
 * Without --send, stays connected and writes every text received from the
 * server to the local clipboard. With --send TEXT, delivers one frame and
 * exits.
 */

#include "clipsync/clip_client.hpp"
#include "clipsync/clipboard.hpp"
#include "clipsync/config.hpp"
#include "clipsync/log.hpp"
#include "clipsync/shutdown.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

namespace {

struct Options {
  const char* config_path = nullptr;
  const char* host = nullptr;
  const char* log_level = nullptr;
  const char* send_text = nullptr;
  long port = -1;
  bool auto_connect = false;
};

void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "Usage: %s [options]\n"
               "  -c, --config FILE      INI file ([client], [log] sections)\n"
               "  -H, --host ADDR        server address (default 192.168.0.100)\n"
               "  -p, --port N           server port (default 28900)\n"
               "  -a, --auto-connect     keep retrying until the server is reachable\n"
               "  -s, --send TEXT        send TEXT once and exit\n"
               "  -l, --log-level LEVEL  debug|info|warn|error|off\n"
               "  -h, --help             show this help\n",
               prog);
}

bool ParsePort(const char* text, long& out) {
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || v < 1 || v > 65535) {
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
    if (std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "--auto-connect") == 0) {
      opts.auto_connect = true;
    } else if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) {
      if ((opts.config_path = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-H") == 0 || std::strcmp(arg, "--host") == 0) {
      if ((opts.host = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--send") == 0) {
      if ((opts.send_text = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--log-level") == 0) {
      if ((opts.log_level = TakeValue(argc, argv, i)) == nullptr) return 2;
    } else if (std::strcmp(arg, "-p") == 0 || std::strcmp(arg, "--port") == 0) {
      const char* v = TakeValue(argc, argv, i);
      if (v == nullptr) return 2;
      if (!ParsePort(v, opts.port)) {
        std::fprintf(stderr, "invalid --port: %s\n", v);
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

int SendOnce(clipsync::ClipClient& client, const std::string& text) {
  auto c = client.Connect();
  if (!c.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Connect failed: %s",
                       clipsync::ClientErrorToString(c.get_error()));
    return 1;
  }
  auto s = client.SendText(text);
  client.Disconnect();
  if (!s.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Send failed: %s",
                       clipsync::ClientErrorToString(s.get_error()));
    return 1;
  }
  CLIPSYNC_LOG_INFO("Main", "Sent %zu bytes", text.size());
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

  clipsync::ClientConfig cfg;
  if (opts.config_path != nullptr) {
    clipsync::ConfigStore store;
    auto loaded = store.LoadFile(opts.config_path);
    if (!loaded.has_value()) {
      CLIPSYNC_LOG_ERROR("Main", "Cannot load %s: %s (line %d)", opts.config_path,
                         clipsync::ConfigErrorToString(loaded.get_error()),
                         store.ErrorLine());
      return 1;
    }
    if (!clipsync::LoadClientConfig(store, cfg).has_value() ||
        !clipsync::LoadLogConfig(store).has_value()) {
      return 1;
    }
  }
  if (opts.host != nullptr) cfg.host = opts.host;
  if (opts.port > 0) cfg.port = static_cast<uint16_t>(opts.port);
  if (opts.auto_connect) cfg.auto_reconnect = true;
  if (opts.log_level != nullptr) {
    clipsync::log::Level level;
    if (!clipsync::log::ParseLevel(opts.log_level, level)) {
      std::fprintf(stderr, "invalid --log-level: %s\n", opts.log_level);
      return 2;
    }
    clipsync::log::SetLevel(level);
  }

  clipsync::CommandClipboard clipboard;
  clipsync::ClipClient client(cfg, clipboard);

  if (opts.send_text != nullptr) {
    return SendOnce(client, opts.send_text);
  }

  clipsync::ShutdownManager shutdown;
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    CLIPSYNC_LOG_ERROR("Main", "Cannot install signal handlers");
    return 1;
  }

  int exit_code = 0;
  std::thread worker([&client, &shutdown, &exit_code] {
    auto r = client.Run();
    if (!r.has_value()) {
      CLIPSYNC_LOG_ERROR("Main", "Client stopped: %s",
                         clipsync::ClientErrorToString(r.get_error()));
      exit_code = 1;
    }
    shutdown.Quit();
  });
  auto reg = shutdown.Register([&client, &worker](int) {
    client.Stop();
    if (worker.joinable()) worker.join();
  });
  if (!reg.has_value()) {
    client.Stop();
    worker.join();
    return 1;
  }
  shutdown.WaitForShutdown();
  clipsync::log::Shutdown();
  return exit_code;
}
