/**
 * @file platform.hpp
 * @brief Build-target check, monotonic clock and debug assertions.
 */

#ifndef CLIPSYNC_PLATFORM_HPP_
#define CLIPSYNC_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

// epoll, accept4, pipe2 and sigtimedwait are Linux interfaces.
#if !defined(__linux__)
#error "clipsync builds on Linux only"
#endif

namespace clipsync {

/// Destructive-interference distance used to pad the SPSC ring indices.
static constexpr size_t kCacheLineSize = 64;

/** @brief Milliseconds on the steady clock; only differences are meaningful. */
inline uint64_t SteadyNowMs() noexcept {
  using std::chrono::milliseconds;
  using std::chrono::steady_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<milliseconds>(
          steady_clock::now().time_since_epoch()).count());
}

namespace detail {

inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "[clipsync] assertion `%s` failed (%s:%d)\n",
                     cond, file, line);
  std::abort();
}

}  // namespace detail

}  // namespace clipsync

/// Programmer-error check, compiled out with NDEBUG.
#ifdef NDEBUG
#define CLIPSYNC_ASSERT(cond) ((void)0)
#else
#define CLIPSYNC_ASSERT(cond)                                          \
  ((cond) ? static_cast<void>(0)                                       \
          : ::clipsync::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // CLIPSYNC_PLATFORM_HPP_
