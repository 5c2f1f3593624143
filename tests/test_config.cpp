/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - INI store and the per-binary loaders.
 */

#include "clipsync/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const char* ini_data =
      "[server]\n"
      "host = 127.0.0.1\n"
      "port = 5090\n"
      "[log]\n"
      "level = INFO\n";

  clipsync::ConfigStore store;
  auto result = store.LoadBuffer(ini_data);
  REQUIRE(result.has_value());
  REQUIRE(store.EntryCount() == 3U);
  REQUIRE(store.GetInt("server", "port", 0) == 5090);
  REQUIRE(store.GetString("server", "host") == "127.0.0.1");
  REQUIRE(store.GetString("log", "level") == "INFO");
}

TEST_CASE("INI lookups are case-insensitive", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[Server]\nPort = 1\n").has_value());
  REQUIRE(store.HasKey("server", "port"));
  REQUIRE(store.HasKey("SERVER", "PORT"));
  REQUIRE(!store.HasKey("client", "port"));
}

TEST_CASE("INI getters fall back to defaults", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.GetString("x", "y", "fallback") == "fallback");
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.GetBool("x", "y", true));
}

TEST_CASE("INI FindInt is strict", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[a]\n"
                           "ok = -12\n"
                           "junk = 12abc\n"
                           "empty =\n"
                           "word = twelve\n")
              .has_value());
  REQUIRE(store.FindInt("a", "ok") == -12);
  REQUIRE(!store.FindInt("a", "junk").has_value());
  REQUIRE(!store.FindInt("a", "empty").has_value());
  REQUIRE(!store.FindInt("a", "word").has_value());
  REQUIRE(!store.FindInt("a", "missing").has_value());
  REQUIRE(store.GetInt("a", "junk", 7) == 7);
}

TEST_CASE("INI GetBool accepts common spellings", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[b]\n"
                           "t1 = true\nt2 = YES\nt3 = on\nt4 = 1\n"
                           "f1 = false\nf2 = No\nf3 = off\nf4 = 0\n"
                           "bad = maybe\n")
              .has_value());
  for (const char* k : {"t1", "t2", "t3", "t4"}) {
    REQUIRE(store.GetBool("b", k, false));
  }
  for (const char* k : {"f1", "f2", "f3", "f4"}) {
    REQUIRE(!store.GetBool("b", k, true));
  }
  REQUIRE(!store.FindBool("b", "bad").has_value());
}

TEST_CASE("INI GetPort validates range", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[p]\nok = 28900\nbig = 70000\nneg = -1\n").has_value());
  REQUIRE(store.GetPort("p", "ok", 1) == 28900);
  REQUIRE(store.GetPort("p", "big", 1) == 1);
  REQUIRE(store.GetPort("p", "neg", 1) == 1);
  REQUIRE(store.GetPort("p", "missing", 2) == 2);
}

TEST_CASE("INI later keys override earlier ones", "[config][ini]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[s]\nk = 1\n").has_value());
  REQUIRE(store.LoadBuffer("[s]\nk = 2\n").has_value());
  REQUIRE(store.GetInt("s", "k") == 2);
  store.Set("s", "k", "3");
  REQUIRE(store.GetInt("s", "k") == 3);
}

TEST_CASE("INI parse error records the line", "[config][ini]") {
  clipsync::ConfigStore store;
  auto r = store.LoadBuffer("[server]\nport 28900\n");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ConfigError::kParseError);
  REQUIRE(store.ErrorLine() == 2);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  clipsync::ConfigStore store;
  auto r = store.LoadFile("/nonexistent/clipsync.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ConfigError::kFileNotFound);
}

TEST_CASE("INI LoadFile reads a file", "[config][ini]") {
  char path[] = "/tmp/clipsync_config_XXXXXX";
  int fd = ::mkstemp(path);
  REQUIRE(fd >= 0);
  const char text[] = "[client]\nhost = 10.1.2.3\n";
  REQUIRE(::write(fd, text, sizeof(text) - 1) ==
          static_cast<ssize_t>(sizeof(text) - 1));
  ::close(fd);

  clipsync::ConfigStore store;
  REQUIRE(store.LoadFile(path).has_value());
  REQUIRE(store.GetString("client", "host") == "10.1.2.3");
  ::unlink(path);
}

// ============================================================================
// Loaders
// ============================================================================

TEST_CASE("config - LoadServerConfig overlays keys", "[config][loader]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[server]\nhost = 127.0.0.1\nport = 4000\npoll_ms = 120\n")
              .has_value());
  clipsync::ServerConfig cfg;
  REQUIRE(clipsync::LoadServerConfig(store, cfg).has_value());
  REQUIRE(cfg.host == "127.0.0.1");
  REQUIRE(cfg.port == 4000);
  REQUIRE(cfg.poll_interval_ms == 120U);
}

TEST_CASE("config - missing keys keep defaults", "[config][loader]") {
  clipsync::ConfigStore store;
  clipsync::ServerConfig scfg;
  REQUIRE(clipsync::LoadServerConfig(store, scfg).has_value());
  REQUIRE(scfg.host == "0.0.0.0");
  REQUIRE(scfg.port == 28900);
  REQUIRE(scfg.poll_interval_ms == 300U);

  clipsync::ClientConfig ccfg;
  REQUIRE(clipsync::LoadClientConfig(store, ccfg).has_value());
  REQUIRE(ccfg.host == "192.168.0.100");
  REQUIRE(!ccfg.auto_reconnect);
}

TEST_CASE("config - invalid server values are rejected", "[config][loader]") {
  clipsync::ServerConfig cfg;
  {
    clipsync::ConfigStore store;
    store.Set("server", "port", "70000");
    REQUIRE(clipsync::LoadServerConfig(store, cfg).get_error() ==
            clipsync::ConfigError::kInvalidValue);
  }
  {
    clipsync::ConfigStore store;
    store.Set("server", "poll_ms", "-5");
    REQUIRE(clipsync::LoadServerConfig(store, cfg).get_error() ==
            clipsync::ConfigError::kInvalidValue);
  }
  REQUIRE(cfg.port == 28900);
}

TEST_CASE("config - LoadClientConfig reads auto_connect", "[config][loader]") {
  clipsync::ConfigStore store;
  REQUIRE(store.LoadBuffer("[client]\nhost = 192.168.1.5\nport = 28901\n"
                           "auto_connect = yes\nconnect_timeout_ms = 800\n")
              .has_value());
  clipsync::ClientConfig cfg;
  REQUIRE(clipsync::LoadClientConfig(store, cfg).has_value());
  REQUIRE(cfg.host == "192.168.1.5");
  REQUIRE(cfg.port == 28901);
  REQUIRE(cfg.auto_reconnect);
  REQUIRE(cfg.connect_timeout_ms == 800U);

  store.Set("client", "auto_connect", "sometimes");
  REQUIRE(clipsync::LoadClientConfig(store, cfg).get_error() ==
          clipsync::ConfigError::kInvalidValue);
}

TEST_CASE("config - LoadLogConfig applies the level", "[config][loader]") {
  auto prev = clipsync::log::GetLevel();
  clipsync::ConfigStore store;
  REQUIRE(clipsync::LoadLogConfig(store).has_value());

  store.Set("log", "level", "warn");
  REQUIRE(clipsync::LoadLogConfig(store).has_value());
  REQUIRE(clipsync::log::GetLevel() == clipsync::log::Level::kWarn);

  store.Set("log", "level", "loud");
  REQUIRE(clipsync::LoadLogConfig(store).get_error() ==
          clipsync::ConfigError::kInvalidValue);
  REQUIRE(clipsync::log::GetLevel() == clipsync::log::Level::kWarn);
  clipsync::log::SetLevel(prev);
}
