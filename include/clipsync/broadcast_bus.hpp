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
 * @file broadcast_bus.hpp
 * @brief Watcher -> event loop hand-off of pre-encoded frames.
 *
 * SpscRing is a wait-free single-producer single-consumer ring. The bus
 * wraps one ring of encoded frames: the clipboard watcher publishes, the
 * event loop drains it to empty once per iteration.
 */

#ifndef CLIPSYNC_BROADCAST_BUS_HPP_
#define CLIPSYNC_BROADCAST_BUS_HPP_

#include "clipsync/platform.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace clipsync {

/// @brief Lock-free SPSC ring buffer.
///
/// @tparam T           Element type (moved in and out).
/// @tparam BufferSize  Capacity (must be a power of 2).
///
/// Exactly one thread may Push and exactly one thread may Pop. Size /
/// IsEmpty / IsFull may be called from either side.
template <typename T, size_t BufferSize, typename IndexT = size_t>
class SpscRing {
 public:
  static_assert(BufferSize != 0, "Buffer size cannot be zero.");
  static_assert((BufferSize & (BufferSize - 1)) == 0,
                "Buffer size must be a power of 2.");
  static_assert(std::is_unsigned<IndexT>::value,
                "Index type must be unsigned.");
  static_assert(BufferSize <= ((std::numeric_limits<IndexT>::max)() >> 1),
                "Buffer size is too large for the given indexing type.");

  SpscRing() noexcept {
    head_.value.store(0, std::memory_order_relaxed);
    tail_.value.store(0, std::memory_order_relaxed);
  }

  SpscRing(const SpscRing&) = delete;
  SpscRing& operator=(const SpscRing&) = delete;

  // ==== Producer API ====

  /// @return false if the ring is full; @p data is left untouched then.
  bool Push(T&& data) noexcept {
    const IndexT cur_head = head_.value.load(std::memory_order_relaxed);
    const IndexT cur_tail = tail_.value.load(std::memory_order_acquire);
    if ((cur_head - cur_tail) == BufferSize) {
      return false;
    }
    slots_[cur_head & kMask] = std::move(data);
    head_.value.store(cur_head + 1, std::memory_order_release);
    return true;
  }

  // ==== Consumer API ====

  /// @return false if the ring is empty.
  bool Pop(T& data) noexcept {
    const IndexT cur_tail = tail_.value.load(std::memory_order_relaxed);
    const IndexT cur_head = head_.value.load(std::memory_order_acquire);
    if (cur_tail == cur_head) {
      return false;
    }
    data = std::move(slots_[cur_tail & kMask]);
    tail_.value.store(cur_tail + 1, std::memory_order_release);
    return true;
  }

  // ==== Query API (either side) ====

  IndexT Size() const noexcept {
    return head_.value.load(std::memory_order_acquire) -
           tail_.value.load(std::memory_order_acquire);
  }

  bool IsEmpty() const noexcept { return Size() == 0; }
  bool IsFull() const noexcept { return Size() == BufferSize; }
  static constexpr size_t Capacity() noexcept { return BufferSize; }

 private:
  static constexpr IndexT kMask = static_cast<IndexT>(BufferSize - 1U);

  // Cache-line padded so producer and consumer indices do not share a line.
  struct alignas(kCacheLineSize) PaddedIndex {
    std::atomic<IndexT> value{0};
  };

  PaddedIndex head_;  // Producer writes
  PaddedIndex tail_;  // Consumer writes
  alignas(kCacheLineSize) std::array<T, BufferSize> slots_{};
};

// ============================================================================
// BroadcastBus
// ============================================================================

#ifndef CLIPSYNC_BROADCAST_BUS_DEPTH
#define CLIPSYNC_BROADCAST_BUS_DEPTH 256U
#endif

using EncodedFrame = std::vector<uint8_t>;

class BroadcastBus {
 public:
  BroadcastBus() : dropped_(0U) {}

  BroadcastBus(const BroadcastBus&) = delete;
  BroadcastBus& operator=(const BroadcastBus&) = delete;

  /**
   * @brief Queue one encoded frame (producer thread only).
   * @return false when the queue is full; the frame is discarded.
   */
  bool Publish(EncodedFrame&& frame) noexcept {
    if (!ring_.Push(std::move(frame))) {
      dropped_.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    return true;
  }

  /**
   * @brief Hand every queued frame to @p fn in FIFO order (consumer only).
   * @return Number of frames drained.
   */
  template <typename Fn>
  uint32_t Drain(Fn&& fn) {
    uint32_t n = 0U;
    EncodedFrame frame;
    while (ring_.Pop(frame)) {
      fn(frame);
      ++n;
    }
    return n;
  }

  uint32_t Pending() const noexcept { return static_cast<uint32_t>(ring_.Size()); }
  uint64_t Dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
  static constexpr size_t Capacity() noexcept { return CLIPSYNC_BROADCAST_BUS_DEPTH; }

 private:
  SpscRing<EncodedFrame, CLIPSYNC_BROADCAST_BUS_DEPTH> ring_;
  std::atomic<uint64_t> dropped_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_BROADCAST_BUS_HPP_
