/**
 * @file frame_codec.hpp
 * @brief Wire framing for clipboard text: [type:1][length:4 BE][utf-8 payload].
 *
 * FrameCodec is stateless. FrameReader accumulates stream bytes for one
 * connection and hands out complete payloads, so coalesced and split reads
 * decode the same way.
 */

#ifndef CLIPSYNC_FRAME_CODEC_HPP_
#define CLIPSYNC_FRAME_CODEC_HPP_

#include "clipsync/platform.hpp"
#include "clipsync/vocabulary.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Wire constants
// ============================================================================

constexpr uint8_t kMsgText = 0x01U;
constexpr uint32_t kFrameHeaderSize = 5U;
constexpr uint32_t kMaxPayload = 1048576U;

enum class FrameError : uint8_t {
  kPayloadTooLarge = 0,
  kBadFrameType,
  kBadFrameLength
};

inline const char* FrameErrorToString(FrameError e) noexcept {
  switch (e) {
    case FrameError::kPayloadTooLarge: return "payload too large";
    case FrameError::kBadFrameType:    return "bad frame type";
    case FrameError::kBadFrameLength:  return "bad frame length";
    default:                           return "unknown";
  }
}

/** @brief One decoded frame and how many buffer bytes it occupied. */
struct DecodedFrame {
  std::string payload;
  uint32_t consumed;
};

// ============================================================================
// UTF-8 validation
// ============================================================================

/**
 * @brief Strict UTF-8 check (RFC 3629): rejects overlongs, surrogates and
 * code points above U+10FFFF.
 */
inline bool IsValidUtf8(const uint8_t* p, size_t len) noexcept {
  size_t i = 0;
  while (i < len) {
    const uint8_t c = p[i];
    if (c < 0x80U) {
      ++i;
      continue;
    }
    uint32_t need;
    uint8_t lo = 0x80U;
    uint8_t hi = 0xBFU;
    if (c >= 0xC2U && c <= 0xDFU) {
      need = 1;
    } else if (c >= 0xE0U && c <= 0xEFU) {
      need = 2;
      if (c == 0xE0U) lo = 0xA0U;
      if (c == 0xEDU) hi = 0x9FU;
    } else if (c >= 0xF0U && c <= 0xF4U) {
      need = 3;
      if (c == 0xF0U) lo = 0x90U;
      if (c == 0xF4U) hi = 0x8FU;
    } else {
      return false;
    }
    if (len - i <= need) {
      return false;
    }
    // Only the first continuation byte has a narrowed range.
    if (p[i + 1] < lo || p[i + 1] > hi) {
      return false;
    }
    for (uint32_t k = 2; k <= need; ++k) {
      if ((p[i + k] & 0xC0U) != 0x80U) {
        return false;
      }
    }
    i += need + 1;
  }
  return true;
}

inline bool IsValidUtf8(const std::string& s) noexcept {
  return IsValidUtf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// ============================================================================
// FrameCodec
// ============================================================================

class FrameCodec {
 public:
  /**
   * @brief Write the 5-byte header for a TEXT frame of @p payload_len bytes.
   * @return kFrameHeaderSize, or 0 if @p buf_size is too small.
   */
  static uint32_t EncodeHeader(uint32_t payload_len, uint8_t* buf,
                               uint32_t buf_size) noexcept {
    if (buf_size < kFrameHeaderSize) return 0;
    buf[0] = kMsgText;
    buf[1] = static_cast<uint8_t>((payload_len >> 24) & 0xFFU);
    buf[2] = static_cast<uint8_t>((payload_len >> 16) & 0xFFU);
    buf[3] = static_cast<uint8_t>((payload_len >> 8) & 0xFFU);
    buf[4] = static_cast<uint8_t>(payload_len & 0xFFU);
    return kFrameHeaderSize;
  }

  /** @brief Read the big-endian length field of a header. */
  static uint32_t DecodeLength(const uint8_t* buf) noexcept {
    return (static_cast<uint32_t>(buf[1]) << 24) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 8) |
           static_cast<uint32_t>(buf[4]);
  }

  /**
   * @brief Encode UTF-8 @p text as a complete TEXT frame.
   * @return Frame bytes, or kPayloadTooLarge above kMaxPayload.
   */
  static expected<std::vector<uint8_t>, FrameError> Encode(
      const std::string& text) {
    if (text.size() > kMaxPayload) {
      return expected<std::vector<uint8_t>, FrameError>::error(
          FrameError::kPayloadTooLarge);
    }
    std::vector<uint8_t> out(kFrameHeaderSize + text.size());
    EncodeHeader(static_cast<uint32_t>(text.size()), out.data(),
                 kFrameHeaderSize);
    if (!text.empty()) {
      std::memcpy(out.data() + kFrameHeaderSize, text.data(), text.size());
    }
    return expected<std::vector<uint8_t>, FrameError>::success(std::move(out));
  }

  /**
   * @brief Try to decode the frame at the front of @p buf.
   *
   * An empty optional means more bytes are needed. The header is validated
   * as soon as it is complete, before the payload arrives.
   */
  static expected<optional<DecodedFrame>, FrameError> TryDecodeOne(
      const uint8_t* buf, size_t len) {
    using Result = expected<optional<DecodedFrame>, FrameError>;
    if (len < kFrameHeaderSize) {
      return Result::success(optional<DecodedFrame>());
    }
    if (buf[0] != kMsgText) {
      return Result::error(FrameError::kBadFrameType);
    }
    const uint32_t length = DecodeLength(buf);
    if (length > kMaxPayload) {
      return Result::error(FrameError::kBadFrameLength);
    }
    if (len < static_cast<size_t>(kFrameHeaderSize) + length) {
      return Result::success(optional<DecodedFrame>());
    }
    DecodedFrame frame;
    frame.payload.assign(reinterpret_cast<const char*>(buf + kFrameHeaderSize),
                         length);
    frame.consumed = kFrameHeaderSize + length;
    return Result::success(optional<DecodedFrame>(std::move(frame)));
  }
};

// ============================================================================
// FrameReader
// ============================================================================

/**
 * @brief Per-connection receive buffer.
 *
 * Feed() appends raw stream bytes; Next() pops one complete payload at a
 * time. After an error the buffer contents are unspecified and the
 * connection should be dropped.
 */
class FrameReader {
 public:
  void Feed(const uint8_t* data, size_t len) {
    buf_.insert(buf_.end(), data, data + len);
  }

  expected<optional<std::string>, FrameError> Next() {
    using Result = expected<optional<std::string>, FrameError>;
    auto r = FrameCodec::TryDecodeOne(buf_.data(), buf_.size());
    if (!r.has_value()) {
      return Result::error(r.get_error());
    }
    if (!r.value().has_value()) {
      return Result::success(optional<std::string>());
    }
    DecodedFrame& frame = r.value().value();
    buf_.erase(buf_.begin(), buf_.begin() + frame.consumed);
    return Result::success(optional<std::string>(std::move(frame.payload)));
  }

  size_t Buffered() const noexcept { return buf_.size(); }
  void Clear() noexcept { buf_.clear(); }

 private:
  std::vector<uint8_t> buf_;
};

}  // namespace clipsync

#endif  // CLIPSYNC_FRAME_CODEC_HPP_
