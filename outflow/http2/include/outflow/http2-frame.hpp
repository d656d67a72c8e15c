#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

#include "outflow/http2-frame-types.hpp"
#include "outflow/raw-bytes.hpp"

namespace outflow::http2 {

/// Convert FrameType to human-readable string for logging/debugging.
constexpr std::string_view FrameTypeName(FrameType type) noexcept {
  switch (type) {
    case FrameType::Data:
      return "DATA";
    case FrameType::Headers:
      return "HEADERS";
    case FrameType::Priority:
      return "PRIORITY";
    case FrameType::RstStream:
      return "RST_STREAM";
    case FrameType::Settings:
      return "SETTINGS";
    case FrameType::PushPromise:
      return "PUSH_PROMISE";
    case FrameType::Ping:
      return "PING";
    case FrameType::GoAway:
      return "GOAWAY";
    case FrameType::WindowUpdate:
      return "WINDOW_UPDATE";
    case FrameType::Continuation:
      return "CONTINUATION";
    default:
      return "UNKNOWN";
  }
}

/// Convert ErrorCode to human-readable string for logging/debugging.
constexpr std::string_view ErrorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::NoError:
      return "NO_ERROR";
    case ErrorCode::ProtocolError:
      return "PROTOCOL_ERROR";
    case ErrorCode::InternalError:
      return "INTERNAL_ERROR";
    case ErrorCode::FlowControlError:
      return "FLOW_CONTROL_ERROR";
    case ErrorCode::SettingsTimeout:
      return "SETTINGS_TIMEOUT";
    case ErrorCode::StreamClosed:
      return "STREAM_CLOSED";
    case ErrorCode::FrameSizeError:
      return "FRAME_SIZE_ERROR";
    case ErrorCode::RefusedStream:
      return "REFUSED_STREAM";
    case ErrorCode::Cancel:
      return "CANCEL";
    case ErrorCode::CompressionError:
      return "COMPRESSION_ERROR";
    case ErrorCode::ConnectError:
      return "CONNECT_ERROR";
    case ErrorCode::EnhanceYourCalm:
      return "ENHANCE_YOUR_CALM";
    case ErrorCode::InadequateSecurity:
      return "INADEQUATE_SECURITY";
    case ErrorCode::Http11Required:
      return "HTTP_1_1_REQUIRED";
    default:
      return "UNKNOWN_ERROR";
  }
}

/// HTTP/2 frame header (9 bytes) as defined in RFC 9113 §4.1.
/// Layout: Length (3 bytes) | Type (1 byte) | Flags (1 byte) | Reserved (1 bit) | Stream ID (31 bits)
struct FrameHeader {
  static constexpr std::size_t kSize = kFrameHeaderSize;

  uint32_t length;  ///< Payload length (24 bits, max 16777215)
  uint8_t typeCode;
  uint8_t flags;
  uint32_t streamId;  ///< 31-bit stream identifier
};

/// Parse a 9-byte frame header from raw bytes. The reserved bit of the stream id is cleared.
/// Precondition: data.size() >= FrameHeader::kSize
[[nodiscard]] FrameHeader ParseFrameHeader(std::span<const std::byte> data) noexcept;

/// Serialize a frame header to a 9-byte buffer. The reserved bit of the stream id is always written as 0.
/// Precondition: buffer has room for FrameHeader::kSize bytes
void WriteFrameHeader(std::byte* buffer, FrameHeader header) noexcept;

/// An immutable HTTP/2 frame of one of the ten known types.
/// The reserved bit of the stream identifier is cleared at construction.
class Frame {
 public:
  /// Throws std::length_error if payload exceeds kMaxMaxFrameSize bytes.
  Frame(FrameType type, uint8_t flags, uint32_t streamId, std::span<const std::byte> payload = {});

  /// Throws std::length_error if payload exceeds kMaxMaxFrameSize bytes.
  Frame(FrameType type, uint8_t flags, uint32_t streamId, RawBytes&& payload);

  [[nodiscard]] FrameType type() const noexcept { return _type; }

  [[nodiscard]] uint8_t flags() const noexcept { return _flags; }

  [[nodiscard]] uint32_t streamId() const noexcept { return _streamId; }

  [[nodiscard]] std::span<const std::byte> payload() const noexcept { return _payload; }

  /// Payload length, as carried in the 24-bit length field.
  [[nodiscard]] uint32_t length() const noexcept { return static_cast<uint32_t>(_payload.size()); }

  /// Number of bytes this frame occupies on the wire (header + payload).
  [[nodiscard]] std::size_t wireSize() const noexcept { return kFrameHeaderSize + _payload.size(); }

  [[nodiscard]] bool hasFlag(uint8_t flag) const noexcept { return (_flags & flag) != 0; }

  // Bit tests only, the meaning of a bit depends on the frame type.
  [[nodiscard]] bool isEndStream() const noexcept { return hasFlag(flags::EndStream); }
  [[nodiscard]] bool isAck() const noexcept { return hasFlag(flags::Ack); }
  [[nodiscard]] bool isEndHeaders() const noexcept { return hasFlag(flags::EndHeaders); }
  [[nodiscard]] bool isPadded() const noexcept { return hasFlag(flags::Padded); }
  [[nodiscard]] bool hasPriority() const noexcept { return hasFlag(flags::Priority); }

  bool operator==(const Frame& other) const noexcept;

 private:
  RawBytes _payload;
  uint32_t _streamId;
  FrameType _type;
  uint8_t _flags;
};

/// A complete frame whose type code is outside the known set. Kept as an explicit value so that
/// callers can skip it (RFC 9113 §4.1 requires ignoring unknown frame types).
struct UnknownFrame {
  [[nodiscard]] std::size_t wireSize() const noexcept { return kFrameHeaderSize + payload.size(); }

  bool operator==(const UnknownFrame&) const noexcept = default;

  RawBytes payload;
  uint32_t streamId;
  uint8_t typeCode;
  uint8_t flags;
};

/// Not enough input to decode a frame yet.
struct Truncated {
  bool operator==(const Truncated&) const noexcept = default;

  /// Total number of bytes needed from the start of the input: kFrameHeaderSize while the header itself is
  /// incomplete, kFrameHeaderSize + declared payload length otherwise.
  std::size_t bytesNeeded;
};

using DecodeResult = std::variant<Frame, UnknownFrame, Truncated>;

/// Serialize a frame: exactly 9 + length bytes.
[[nodiscard]] RawBytes EncodeFrame(const Frame& frame);

/// Append the serialized frame to 'out'. Returns the number of bytes written.
std::size_t EncodeFrame(const Frame& frame, RawBytes& out);

/// Decode one frame from the start of 'data'. Only the first 9 + length bytes are read, callers advance their
/// input by the decoded frame's wireSize().
[[nodiscard]] DecodeResult DecodeFrame(std::span<const std::byte> data);

// ============================
// Frame builders
// ============================

/// SETTINGS frame parameter (identifier + value pair).
struct SettingsEntry {
  bool operator==(const SettingsEntry&) const noexcept = default;

  SettingsParameter id;
  uint32_t value;
};

[[nodiscard]] Frame MakeDataFrame(uint32_t streamId, std::span<const std::byte> data, bool endStream);

/// HEADERS frame carrying an already encoded header block fragment.
[[nodiscard]] Frame MakeHeadersFrame(uint32_t streamId, std::span<const std::byte> headerBlock, bool endStream,
                                     bool endHeaders);

[[nodiscard]] Frame MakeSettingsFrame(std::span<const SettingsEntry> entries);

[[nodiscard]] Frame MakeSettingsAckFrame();

/// The reserved bit of the increment is cleared.
[[nodiscard]] Frame MakeWindowUpdateFrame(uint32_t streamId, uint32_t windowSizeIncrement);

/// The reserved bit of lastStreamId is cleared.
[[nodiscard]] Frame MakeGoAwayFrame(uint32_t lastStreamId, ErrorCode errorCode, std::string_view debugData = {});

[[nodiscard]] Frame MakeRstStreamFrame(uint32_t streamId, ErrorCode errorCode);

[[nodiscard]] Frame MakePingFrame(std::span<const std::byte, 8> opaqueData, bool isAck);

/// PING with an 8-byte big-endian opaque value.
[[nodiscard]] Frame MakePingFrame(uint64_t opaqueData, bool isAck);

// ============================
// Control frame payload parsing
// ============================

enum class FrameParseResult : uint8_t { Ok, FrameSizeError };

/// Parsed SETTINGS frame.
struct SettingsFrame {
  static constexpr std::size_t kMaxEntries = 6;  // RFC defines 6 standard settings

  std::array<SettingsEntry, kMaxEntries> entries;
  std::size_t entryCount;
  bool isAck;
};

/// Parsed PING frame.
struct PingFrame {
  std::array<std::byte, 8> opaqueData;
  bool isAck;
};

/// Parsed GOAWAY frame. debugData points into the frame payload.
struct GoAwayFrame {
  uint32_t lastStreamId;
  ErrorCode errorCode;
  std::span<const std::byte> debugData;
};

struct WindowUpdateFrame {
  uint32_t windowSizeIncrement;
};

struct RstStreamFrame {
  ErrorCode errorCode;
};

[[nodiscard]] FrameParseResult ParseSettingsPayload(const Frame& frame, SettingsFrame& out) noexcept;

[[nodiscard]] FrameParseResult ParsePingPayload(const Frame& frame, PingFrame& out) noexcept;

[[nodiscard]] FrameParseResult ParseGoAwayPayload(const Frame& frame, GoAwayFrame& out) noexcept;

[[nodiscard]] FrameParseResult ParseWindowUpdatePayload(const Frame& frame, WindowUpdateFrame& out) noexcept;

[[nodiscard]] FrameParseResult ParseRstStreamPayload(const Frame& frame, RstStreamFrame& out) noexcept;

}  // namespace outflow::http2
