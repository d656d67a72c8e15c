#include "outflow/http2-frame-reader.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string_view>
#include <variant>

#include "outflow/http2-frame.hpp"
#include "outflow/raw-bytes.hpp"

namespace outflow::http2 {

namespace {
std::span<const std::byte> AsBytes(std::string_view sv) { return std::as_bytes(std::span<const char>(sv)); }
}  // namespace

TEST(Http2FrameReader, EmptyReaderIsTruncated) {
  FrameReader reader;
  DecodeResult result = reader.next();
  ASSERT_TRUE(std::holds_alternative<Truncated>(result));
  EXPECT_EQ(std::get<Truncated>(result).bytesNeeded, kFrameHeaderSize);
  EXPECT_EQ(reader.pendingBytes(), 0U);
}

TEST(Http2FrameReader, ByteByByteDelivery) {
  const Frame expected = MakeDataFrame(1, AsBytes("split across reads"), true);
  RawBytes wire = EncodeFrame(expected);

  FrameReader reader;
  for (std::size_t idx = 0; idx + 1 < wire.size(); ++idx) {
    reader.append(std::span<const std::byte>(wire).subspan(idx, 1));
    ASSERT_TRUE(std::holds_alternative<Truncated>(reader.next()));
  }
  reader.append(std::span<const std::byte>(wire).last(1));

  DecodeResult result = reader.next();
  ASSERT_TRUE(std::holds_alternative<Frame>(result));
  EXPECT_EQ(std::get<Frame>(result), expected);
  EXPECT_EQ(reader.pendingBytes(), 0U);
}

TEST(Http2FrameReader, MultipleFramesInOneChunkWithUnknownInBetween) {
  RawBytes wire = EncodeFrame(MakeSettingsAckFrame());
  // Unknown extension frame (type 0x42) with 3 bytes of payload
  const std::byte unknownFrame[] = {std::byte{0}, std::byte{0}, std::byte{3}, std::byte{0x42}, std::byte{0},
                                    std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1},    std::byte{'a'},
                                    std::byte{'b'}, std::byte{'c'}};
  wire.append(std::span<const std::byte>(unknownFrame));
  EncodeFrame(MakePingFrame(42, false), wire);
  // Partial header of a fourth frame
  wire.append(AsBytes(std::string_view("\x00\x00", 2)));

  FrameReader reader;
  reader.append(wire);

  DecodeResult first = reader.next();
  ASSERT_TRUE(std::holds_alternative<Frame>(first));
  EXPECT_TRUE(std::get<Frame>(first).isAck());

  DecodeResult second = reader.next();
  ASSERT_TRUE(std::holds_alternative<UnknownFrame>(second));
  EXPECT_EQ(std::get<UnknownFrame>(second).typeCode, 0x42);

  DecodeResult third = reader.next();
  ASSERT_TRUE(std::holds_alternative<Frame>(third));
  EXPECT_EQ(std::get<Frame>(third).type(), FrameType::Ping);

  EXPECT_TRUE(std::holds_alternative<Truncated>(reader.next()));
  EXPECT_EQ(reader.pendingBytes(), 2U);
}

}  // namespace outflow::http2
