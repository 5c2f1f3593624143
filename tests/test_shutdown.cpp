/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "clipsync/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

TEST_CASE("ShutdownManager Register callbacks", "[shutdown]") {
  clipsync::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());
  for (int i = 0; i < 32; ++i) {
    REQUIRE(mgr.Register([](int) {}).has_value());
  }
}

TEST_CASE("ShutdownManager rejects empty callback", "[shutdown]") {
  clipsync::ShutdownManager mgr;
  auto r = mgr.Register(clipsync::ShutdownFn());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::ShutdownError::kInvalidCallback);
}

TEST_CASE("ShutdownManager second instance is invalid", "[shutdown]") {
  clipsync::ShutdownManager first;
  REQUIRE(first.IsValid());
  {
    clipsync::ShutdownManager second;
    REQUIRE(!second.IsValid());
    auto r = second.Register([](int) {});
    REQUIRE(r.get_error() == clipsync::ShutdownError::kAlreadyInstantiated);
    REQUIRE(second.InstallSignalHandlers().get_error() ==
            clipsync::ShutdownError::kAlreadyInstantiated);
  }
  // The invalid instance must not release the slot held by the first.
  clipsync::ShutdownManager third;
  REQUIRE(!third.IsValid());
}

TEST_CASE("ShutdownManager Quit and IsShutdownRequested", "[shutdown]") {
  clipsync::ShutdownManager mgr;
  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit(0);
  REQUIRE(mgr.IsShutdownRequested());
  REQUIRE(mgr.Signal() == 0);
}

TEST_CASE("ShutdownManager LIFO callback order", "[shutdown]") {
  clipsync::ShutdownManager mgr;
  std::vector<int> order;
  int seen_signo = -1;
  REQUIRE(mgr.Register([&order](int) { order.push_back(1); }).has_value());
  REQUIRE(mgr.Register([&order](int) { order.push_back(2); }).has_value());
  REQUIRE(mgr.Register([&order, &seen_signo](int signo) {
    order.push_back(3);
    seen_signo = signo;
  }).has_value());

  mgr.Quit(42);
  mgr.WaitForShutdown();
  REQUIRE(order == std::vector<int>{3, 2, 1});
  REQUIRE(seen_signo == 42);

  // Callbacks run once.
  mgr.WaitForShutdown();
  REQUIRE(order.size() == 3U);
}

TEST_CASE("ShutdownManager first trigger wins", "[shutdown]") {
  clipsync::ShutdownManager mgr;
  mgr.Quit(SIGTERM);
  mgr.Quit(SIGINT);
  REQUIRE(mgr.Signal() == SIGTERM);
}

TEST_CASE("ShutdownManager Quit from another thread wakes the waiter",
          "[shutdown]") {
  clipsync::ShutdownManager mgr;
  bool ran = false;
  REQUIRE(mgr.Register([&ran](int) { ran = true; }).has_value());
  std::thread quitter([&mgr]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    mgr.Quit();
  });
  mgr.WaitForShutdown();
  quitter.join();
  REQUIRE(ran);
}

TEST_CASE("ShutdownManager handles SIGTERM", "[shutdown][signal]") {
  clipsync::ShutdownManager mgr;
  REQUIRE(mgr.InstallSignalHandlers().has_value());
  int got = 0;
  REQUIRE(mgr.Register([&got](int signo) { got = signo; }).has_value());

  REQUIRE(std::raise(SIGTERM) == 0);
  mgr.WaitForShutdown();
  REQUIRE(mgr.IsShutdownRequested());
  REQUIRE(got == SIGTERM);
}
