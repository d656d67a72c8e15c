#include "outflow/http2-frame.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "outflow/http2-frame-types.hpp"
#include "outflow/raw-bytes.hpp"

namespace outflow::http2 {

namespace {

// Read a 24-bit big-endian value.
constexpr uint32_t Read24BE(const std::byte* data) noexcept {
  return (static_cast<uint32_t>(data[0]) << 16) | (static_cast<uint32_t>(data[1]) << 8) |
         static_cast<uint32_t>(data[2]);
}

// Read a 32-bit big-endian value.
constexpr uint32_t Read32BE(const std::byte* data) noexcept {
  return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
         (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

// Read a 16-bit big-endian value.
constexpr uint16_t Read16BE(const std::byte* data) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | static_cast<uint16_t>(data[1]));
}

// Write a 24-bit big-endian value.
constexpr void Write24BE(std::byte* data, uint32_t value) noexcept {
  data[0] = static_cast<std::byte>((value >> 16) & 0xFF);
  data[1] = static_cast<std::byte>((value >> 8) & 0xFF);
  data[2] = static_cast<std::byte>(value & 0xFF);
}

// Write a 32-bit big-endian value.
constexpr void Write32BE(std::byte* data, uint32_t value) noexcept {
  data[0] = static_cast<std::byte>((value >> 24) & 0xFF);
  data[1] = static_cast<std::byte>((value >> 16) & 0xFF);
  data[2] = static_cast<std::byte>((value >> 8) & 0xFF);
  data[3] = static_cast<std::byte>(value & 0xFF);
}

// Write a 16-bit big-endian value.
constexpr void Write16BE(std::byte* data, uint16_t value) noexcept {
  data[0] = static_cast<std::byte>((value >> 8) & 0xFF);
  data[1] = static_cast<std::byte>(value & 0xFF);
}

// Type code -> known FrameType lookup, one entry per possible byte value.
struct FrameTypeEntry {
  FrameType type;
  bool known;
};

constexpr std::array<FrameTypeEntry, 256> kFrameTypeTable = [] {
  std::array<FrameTypeEntry, 256> table{};
  for (uint8_t code = 0; code < kNbFrameTypes; ++code) {
    table[code] = FrameTypeEntry{static_cast<FrameType>(code), true};
  }
  return table;
}();

static_assert(kFrameTypeTable[0x09].known && kFrameTypeTable[0x09].type == FrameType::Continuation);
static_assert(!kFrameTypeTable[0x0A].known);

void CheckPayloadSize(std::size_t payloadSize) {
  if (!IsValidFrameSize(payloadSize)) {
    throw std::length_error("HTTP/2 frame payload exceeds 16777215 bytes");
  }
}

RawBytes MakePayload(std::size_t capacity) { return RawBytes(capacity); }

}  // namespace

// ============================
// Frame header parsing/writing
// ============================

FrameHeader ParseFrameHeader(std::span<const std::byte> data) noexcept {
  assert(data.size() >= FrameHeader::kSize);

  return FrameHeader{Read24BE(data.data()), static_cast<uint8_t>(data[3]), static_cast<uint8_t>(data[4]),
                     Read32BE(data.data() + 5) & kStreamIdMask};
}

void WriteFrameHeader(std::byte* buffer, FrameHeader header) noexcept {
  Write24BE(buffer, header.length);
  buffer[3] = static_cast<std::byte>(header.typeCode);
  buffer[4] = static_cast<std::byte>(header.flags);
  Write32BE(buffer + 5, header.streamId & kStreamIdMask);  // Clear reserved bit
}

// ============================
// Frame
// ============================

Frame::Frame(FrameType type, uint8_t flags, uint32_t streamId, std::span<const std::byte> payload)
    : _streamId(streamId & kStreamIdMask), _type(type), _flags(flags) {
  CheckPayloadSize(payload.size());
  _payload.append(payload);
}

Frame::Frame(FrameType type, uint8_t flags, uint32_t streamId, RawBytes&& payload)
    : _payload(std::move(payload)), _streamId(streamId & kStreamIdMask), _type(type), _flags(flags) {
  CheckPayloadSize(_payload.size());
}

bool Frame::operator==(const Frame& other) const noexcept {
  return _type == other._type && _flags == other._flags && _streamId == other._streamId &&
         _payload == other._payload;
}

// ============================
// Encoding / decoding
// ============================

std::size_t EncodeFrame(const Frame& frame, RawBytes& out) {
  const std::size_t totalSize = frame.wireSize();

  out.ensureAvailableCapacityExponential(totalSize);

  WriteFrameHeader(out.end(),
                   FrameHeader{frame.length(), static_cast<uint8_t>(frame.type()), frame.flags(), frame.streamId()});
  out.addSize(FrameHeader::kSize);
  out.unchecked_append(frame.payload());

  return totalSize;
}

RawBytes EncodeFrame(const Frame& frame) {
  RawBytes out(frame.wireSize());
  EncodeFrame(frame, out);
  return out;
}

DecodeResult DecodeFrame(std::span<const std::byte> data) {
  if (data.size() < FrameHeader::kSize) {
    return Truncated{FrameHeader::kSize};
  }
  const FrameHeader header = ParseFrameHeader(data);
  const std::size_t wireSize = FrameHeader::kSize + header.length;
  if (data.size() < wireSize) {
    return Truncated{wireSize};
  }

  const auto payload = data.subspan(FrameHeader::kSize, header.length);
  const FrameTypeEntry entry = kFrameTypeTable[header.typeCode];
  if (!entry.known) {
    return UnknownFrame{RawBytes(payload), header.streamId, header.typeCode, header.flags};
  }
  return Frame(entry.type, header.flags, header.streamId, payload);
}

// ============================
// Frame builders
// ============================

Frame MakeDataFrame(uint32_t streamId, std::span<const std::byte> data, bool endStream) {
  return {FrameType::Data, endStream ? flags::EndStream : flags::None, streamId, data};
}

Frame MakeHeadersFrame(uint32_t streamId, std::span<const std::byte> headerBlock, bool endStream, bool endHeaders) {
  uint8_t frameFlags = flags::None;
  if (endStream) {
    frameFlags |= flags::EndStream;
  }
  if (endHeaders) {
    frameFlags |= flags::EndHeaders;
  }
  return {FrameType::Headers, frameFlags, streamId, headerBlock};
}

Frame MakeSettingsFrame(std::span<const SettingsEntry> entries) {
  RawBytes payload = MakePayload(entries.size() * 6);
  for (const auto& entry : entries) {
    Write16BE(payload.end(), static_cast<uint16_t>(entry.id));
    Write32BE(payload.end() + 2, entry.value);
    payload.addSize(6);
  }
  return {FrameType::Settings, flags::None, kConnectionStreamId, std::move(payload)};
}

Frame MakeSettingsAckFrame() { return {FrameType::Settings, flags::Ack, kConnectionStreamId}; }

Frame MakeWindowUpdateFrame(uint32_t streamId, uint32_t windowSizeIncrement) {
  RawBytes payload = MakePayload(4);
  Write32BE(payload.end(), windowSizeIncrement & kStreamIdMask);  // Clear reserved bit
  payload.addSize(4);
  return {FrameType::WindowUpdate, flags::None, streamId, std::move(payload)};
}

Frame MakeGoAwayFrame(uint32_t lastStreamId, ErrorCode errorCode, std::string_view debugData) {
  RawBytes payload = MakePayload(8 + debugData.size());
  Write32BE(payload.end(), lastStreamId & kStreamIdMask);
  Write32BE(payload.end() + 4, static_cast<uint32_t>(errorCode));
  payload.addSize(8);
  payload.unchecked_append(std::as_bytes(std::span<const char>(debugData)));
  return {FrameType::GoAway, flags::None, kConnectionStreamId, std::move(payload)};
}

Frame MakeRstStreamFrame(uint32_t streamId, ErrorCode errorCode) {
  RawBytes payload = MakePayload(4);
  Write32BE(payload.end(), static_cast<uint32_t>(errorCode));
  payload.addSize(4);
  return {FrameType::RstStream, flags::None, streamId, std::move(payload)};
}

Frame MakePingFrame(std::span<const std::byte, 8> opaqueData, bool isAck) {
  return {FrameType::Ping, isAck ? flags::Ack : flags::None, kConnectionStreamId, opaqueData};
}

Frame MakePingFrame(uint64_t opaqueData, bool isAck) {
  std::array<std::byte, 8> bytes;
  Write32BE(bytes.data(), static_cast<uint32_t>(opaqueData >> 32));
  Write32BE(bytes.data() + 4, static_cast<uint32_t>(opaqueData & 0xFFFFFFFF));
  return MakePingFrame(bytes, isAck);
}

// ============================
// Control frame payload parsing
// ============================

FrameParseResult ParseSettingsPayload(const Frame& frame, SettingsFrame& out) noexcept {
  const auto payload = frame.payload();
  out.isAck = frame.isAck();
  out.entryCount = 0;

  if (out.isAck) {
    return payload.empty() ? FrameParseResult::Ok : FrameParseResult::FrameSizeError;
  }

  if (payload.size() % 6 != 0) {
    return FrameParseResult::FrameSizeError;
  }

  const std::size_t numEntries = std::min(payload.size() / 6, SettingsFrame::kMaxEntries);
  for (std::size_t idx = 0; idx < numEntries; ++idx) {
    const std::byte* entry = payload.data() + (idx * 6);
    out.entries[idx] = SettingsEntry{static_cast<SettingsParameter>(Read16BE(entry)), Read32BE(entry + 2)};
  }
  out.entryCount = numEntries;

  return FrameParseResult::Ok;
}

FrameParseResult ParsePingPayload(const Frame& frame, PingFrame& out) noexcept {
  const auto payload = frame.payload();
  if (payload.size() != 8) {
    return FrameParseResult::FrameSizeError;
  }

  out.isAck = frame.isAck();
  std::memcpy(out.opaqueData.data(), payload.data(), 8);
  return FrameParseResult::Ok;
}

FrameParseResult ParseGoAwayPayload(const Frame& frame, GoAwayFrame& out) noexcept {
  const auto payload = frame.payload();
  if (payload.size() < 8) {
    return FrameParseResult::FrameSizeError;
  }

  out.lastStreamId = Read32BE(payload.data()) & kStreamIdMask;
  out.errorCode = static_cast<ErrorCode>(Read32BE(payload.data() + 4));
  out.debugData = payload.subspan(8);
  return FrameParseResult::Ok;
}

FrameParseResult ParseWindowUpdatePayload(const Frame& frame, WindowUpdateFrame& out) noexcept {
  const auto payload = frame.payload();
  if (payload.size() != 4) {
    return FrameParseResult::FrameSizeError;
  }

  out.windowSizeIncrement = Read32BE(payload.data()) & kStreamIdMask;  // Clear reserved bit
  return FrameParseResult::Ok;
}

FrameParseResult ParseRstStreamPayload(const Frame& frame, RstStreamFrame& out) noexcept {
  const auto payload = frame.payload();
  if (payload.size() != 4) {
    return FrameParseResult::FrameSizeError;
  }

  out.errorCode = static_cast<ErrorCode>(Read32BE(payload.data()));
  return FrameParseResult::Ok;
}

}  // namespace outflow::http2
