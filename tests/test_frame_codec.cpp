/**
 * @file test_frame_codec.cpp
 * @brief Tests for frame_codec.hpp: header layout, stream reassembly, limits.
 */

#include <catch2/catch_test_macros.hpp>
#include "clipsync/frame_codec.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> MakeHeader(uint8_t type, uint32_t length) {
  return {type,
          static_cast<uint8_t>(length >> 24),
          static_cast<uint8_t>(length >> 16),
          static_cast<uint8_t>(length >> 8),
          static_cast<uint8_t>(length)};
}

std::vector<uint8_t> EncodeOrDie(const std::string& text) {
  auto r = clipsync::FrameCodec::Encode(text);
  REQUIRE(r.has_value());
  return r.value();
}

}  // namespace

// ============================================================================
// Encode
// ============================================================================

TEST_CASE("frame_codec - Encode hello produces exact bytes", "[frame_codec]") {
  auto frame = EncodeOrDie("hello");
  const std::vector<uint8_t> expected_bytes = {0x01, 0x00, 0x00, 0x00, 0x05,
                                               'h',  'e',  'l',  'l',  'o'};
  REQUIRE(frame == expected_bytes);
}

TEST_CASE("frame_codec - Encode empty text is header only", "[frame_codec]") {
  auto frame = EncodeOrDie("");
  REQUIRE(frame.size() == clipsync::kFrameHeaderSize);
  REQUIRE(frame[0] == clipsync::kMsgText);
  REQUIRE(clipsync::FrameCodec::DecodeLength(frame.data()) == 0U);
}

TEST_CASE("frame_codec - length field is big-endian", "[frame_codec]") {
  uint8_t hdr[clipsync::kFrameHeaderSize];
  REQUIRE(clipsync::FrameCodec::EncodeHeader(0x01020304U, hdr, sizeof(hdr)) ==
          clipsync::kFrameHeaderSize);
  REQUIRE(hdr[0] == 0x01);
  REQUIRE(hdr[1] == 0x01);
  REQUIRE(hdr[2] == 0x02);
  REQUIRE(hdr[3] == 0x03);
  REQUIRE(hdr[4] == 0x04);
  REQUIRE(clipsync::FrameCodec::DecodeLength(hdr) == 0x01020304U);
}

TEST_CASE("frame_codec - EncodeHeader rejects short buffer", "[frame_codec]") {
  uint8_t hdr[4];
  REQUIRE(clipsync::FrameCodec::EncodeHeader(1U, hdr, sizeof(hdr)) == 0U);
}

TEST_CASE("frame_codec - Encode accepts exactly the payload limit",
          "[frame_codec][limits]") {
  std::string at_limit(clipsync::kMaxPayload, 'a');
  auto r = clipsync::FrameCodec::Encode(at_limit);
  REQUIRE(r.has_value());
  REQUIRE(r.value().size() == clipsync::kFrameHeaderSize + clipsync::kMaxPayload);
}

TEST_CASE("frame_codec - Encode rejects payload above the limit",
          "[frame_codec][limits]") {
  std::string over(clipsync::kMaxPayload + 1U, 'a');
  auto r = clipsync::FrameCodec::Encode(over);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::FrameError::kPayloadTooLarge);
}

// ============================================================================
// TryDecodeOne
// ============================================================================

TEST_CASE("frame_codec - TryDecodeOne needs a full header", "[frame_codec]") {
  auto hdr = MakeHeader(0x01, 3);
  auto r = clipsync::FrameCodec::TryDecodeOne(hdr.data(), 4);
  REQUIRE(r.has_value());
  REQUIRE(!r.value().has_value());
}

TEST_CASE("frame_codec - TryDecodeOne waits for the payload", "[frame_codec]") {
  auto buf = MakeHeader(0x01, 3);
  buf.push_back('a');
  auto r = clipsync::FrameCodec::TryDecodeOne(buf.data(), buf.size());
  REQUIRE(r.has_value());
  REQUIRE(!r.value().has_value());
}

TEST_CASE("frame_codec - TryDecodeOne reports consumed bytes", "[frame_codec]") {
  auto buf = EncodeOrDie("abc");
  buf.push_back(0x01);  // start of a following frame
  auto r = clipsync::FrameCodec::TryDecodeOne(buf.data(), buf.size());
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE(r.value().value().payload == "abc");
  REQUIRE(r.value().value().consumed == 8U);
}

TEST_CASE("frame_codec - unknown type byte is a protocol error", "[frame_codec]") {
  auto buf = MakeHeader(0x02, 0);
  auto r = clipsync::FrameCodec::TryDecodeOne(buf.data(), buf.size());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::FrameError::kBadFrameType);
}

TEST_CASE("frame_codec - oversize length rejected before payload arrives",
          "[frame_codec][limits]") {
  auto buf = MakeHeader(0x01, clipsync::kMaxPayload + 1U);
  auto r = clipsync::FrameCodec::TryDecodeOne(buf.data(), buf.size());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::FrameError::kBadFrameLength);

  auto huge = MakeHeader(0x01, 0xFFFFFFFFU);
  auto r2 = clipsync::FrameCodec::TryDecodeOne(huge.data(), huge.size());
  REQUIRE(!r2.has_value());
  REQUIRE(r2.get_error() == clipsync::FrameError::kBadFrameLength);
}

TEST_CASE("frame_codec - FrameErrorToString", "[frame_codec]") {
  REQUIRE(std::strcmp(clipsync::FrameErrorToString(
                          clipsync::FrameError::kBadFrameLength),
                      "bad frame length") == 0);
  REQUIRE(std::strcmp(clipsync::FrameErrorToString(
                          clipsync::FrameError::kBadFrameType),
                      "bad frame type") == 0);
}

// ============================================================================
// FrameReader
// ============================================================================

TEST_CASE("frame_codec - FrameReader reassembles byte-by-byte feed",
          "[frame_codec][reader]") {
  auto frame = EncodeOrDie("world");
  clipsync::FrameReader reader;
  for (size_t i = 0; i + 1 < frame.size(); ++i) {
    reader.Feed(&frame[i], 1);
    auto r = reader.Next();
    REQUIRE(r.has_value());
    REQUIRE(!r.value().has_value());
  }
  reader.Feed(&frame.back(), 1);
  auto r = reader.Next();
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE(r.value().value() == "world");
  REQUIRE(reader.Buffered() == 0U);
}

TEST_CASE("frame_codec - FrameReader splits coalesced frames in order",
          "[frame_codec][reader]") {
  std::vector<uint8_t> stream;
  for (const char* t : {"one", "", "three"}) {
    auto f = EncodeOrDie(t);
    stream.insert(stream.end(), f.begin(), f.end());
  }
  clipsync::FrameReader reader;
  reader.Feed(stream.data(), stream.size());

  auto a = reader.Next();
  REQUIRE(a.value().value() == "one");
  auto b = reader.Next();
  REQUIRE(b.value().has_value());
  REQUIRE(b.value().value().empty());
  auto c = reader.Next();
  REQUIRE(c.value().value() == "three");
  auto d = reader.Next();
  REQUIRE(d.has_value());
  REQUIRE(!d.value().has_value());
}

TEST_CASE("frame_codec - FrameReader keeps a partial tail", "[frame_codec][reader]") {
  auto f1 = EncodeOrDie("abc");
  auto f2 = EncodeOrDie("defg");
  std::vector<uint8_t> stream(f1);
  stream.insert(stream.end(), f2.begin(), f2.begin() + 3);

  clipsync::FrameReader reader;
  reader.Feed(stream.data(), stream.size());
  REQUIRE(reader.Next().value().value() == "abc");
  REQUIRE(!reader.Next().value().has_value());
  REQUIRE(reader.Buffered() == 3U);

  reader.Feed(f2.data() + 3, f2.size() - 3);
  REQUIRE(reader.Next().value().value() == "defg");
}

TEST_CASE("frame_codec - FrameReader surfaces bad header", "[frame_codec][reader]") {
  auto bad = MakeHeader(0x01, clipsync::kMaxPayload + 1U);
  clipsync::FrameReader reader;
  reader.Feed(bad.data(), bad.size());
  auto r = reader.Next();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == clipsync::FrameError::kBadFrameLength);
  reader.Clear();
  REQUIRE(reader.Buffered() == 0U);
}

// ============================================================================
// UTF-8
// ============================================================================

TEST_CASE("frame_codec - IsValidUtf8 accepts well-formed text", "[frame_codec][utf8]") {
  REQUIRE(clipsync::IsValidUtf8(std::string("")));
  REQUIRE(clipsync::IsValidUtf8(std::string("plain ascii")));
  REQUIRE(clipsync::IsValidUtf8(std::string("caf\xC3\xA9")));            // é
  REQUIRE(clipsync::IsValidUtf8(std::string("\xE4\xBD\xA0\xE5\xA5\xBD")));  // 你好
  REQUIRE(clipsync::IsValidUtf8(std::string("\xF0\x9F\x98\x80")));        // U+1F600
  REQUIRE(clipsync::IsValidUtf8(std::string("\xF4\x8F\xBF\xBF")));        // U+10FFFF
}

TEST_CASE("frame_codec - IsValidUtf8 rejects malformed text", "[frame_codec][utf8]") {
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xFF")));
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xC3")));              // truncated
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xC0\xAF")));          // overlong '/'
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xE0\x80\xAF")));      // overlong
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xED\xA0\x80")));      // surrogate
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xF4\x90\x80\x80")));  // > U+10FFFF
  REQUIRE(!clipsync::IsValidUtf8(std::string("a\x80z")));            // stray continuation
  REQUIRE(!clipsync::IsValidUtf8(std::string("\xE4\xBD" "A")));      // bad continuation
}
