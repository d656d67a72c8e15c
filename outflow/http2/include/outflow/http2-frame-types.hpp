#pragma once

#include <cstddef>
#include <cstdint>

namespace outflow::http2 {

// HTTP/2 Frame Types (RFC 9113 §6)
// ================================
// Closed set: any other code on the wire decodes to an UnknownFrame value.
enum class FrameType : uint8_t {
  Data = 0x00,          // DATA frame - carries request/response body
  Headers = 0x01,       // HEADERS frame - carries header fields
  Priority = 0x02,      // PRIORITY frame - specifies stream priority (deprecated in RFC 9113)
  RstStream = 0x03,     // RST_STREAM frame - terminates a stream
  Settings = 0x04,      // SETTINGS frame - configuration parameters
  PushPromise = 0x05,   // PUSH_PROMISE frame - server push
  Ping = 0x06,          // PING frame - connection liveness/RTT measurement
  GoAway = 0x07,        // GOAWAY frame - graceful connection shutdown
  WindowUpdate = 0x08,  // WINDOW_UPDATE frame - flow control
  Continuation = 0x09,  // CONTINUATION frame - continuation of header block
};

inline constexpr std::size_t kNbFrameTypes = 10;

// HTTP/2 Error Codes (RFC 9113 §7)
// ================================
// 32-bit values on the wire.
enum class ErrorCode : uint32_t {  // NOLINT(performance-enum-size)
  NoError = 0x00,                  // Graceful shutdown
  ProtocolError = 0x01,            // Protocol error detected
  InternalError = 0x02,            // Implementation fault
  FlowControlError = 0x03,         // Flow control limits exceeded
  SettingsTimeout = 0x04,          // Settings not acknowledged in time
  StreamClosed = 0x05,             // Frame received for closed stream
  FrameSizeError = 0x06,           // Frame size incorrect
  RefusedStream = 0x07,            // Stream not processed
  Cancel = 0x08,                   // Stream cancelled
  CompressionError = 0x09,         // HPACK decompression failed
  ConnectError = 0x0A,             // TCP connection error for CONNECT
  EnhanceYourCalm = 0x0B,          // Excessive load
  InadequateSecurity = 0x0C,       // Negotiated TLS parameters inadequate
  Http11Required = 0x0D,           // HTTP/1.1 required for this request
};

// HTTP/2 Settings Parameters (RFC 9113 §6.5.2)
// =============================================
// 16-bit identifiers on the wire.
enum class SettingsParameter : uint16_t {  // NOLINT(performance-enum-size)
  HeaderTableSize = 0x01,
  EnablePush = 0x02,
  MaxConcurrentStreams = 0x03,
  InitialWindowSize = 0x04,
  MaxFrameSize = 0x05,
  MaxHeaderListSize = 0x06,
};

// HTTP/2 Frame Flags (RFC 9113 §6)
// ================================
// Bits are shared between frame types: the codec only tests bits, meaning depends on the frame type.
namespace flags {

inline constexpr uint8_t None = 0x00;

inline constexpr uint8_t EndStream = 0x01;   // DATA, HEADERS
inline constexpr uint8_t Ack = 0x01;         // SETTINGS, PING
inline constexpr uint8_t EndHeaders = 0x04;  // HEADERS, PUSH_PROMISE, CONTINUATION
inline constexpr uint8_t Padded = 0x08;      // DATA, HEADERS, PUSH_PROMISE
inline constexpr uint8_t Priority = 0x20;    // HEADERS

}  // namespace flags

inline constexpr uint32_t kDefaultMaxFrameSize = 16384;
inline constexpr uint32_t kMaxMaxFrameSize = 16777215;  // 2^24 - 1, largest encodable payload length
inline constexpr uint32_t kMaxStreamId = 2147483647;    // 2^31 - 1
inline constexpr uint32_t kStreamIdMask = 0x7FFFFFFF;   // clears the reserved bit

// Frame header size is always 9 bytes
inline constexpr std::size_t kFrameHeaderSize = 9;

inline constexpr uint32_t kConnectionStreamId = 0;

[[nodiscard]] constexpr bool IsValidFrameSize(std::size_t payloadSize) noexcept {
  return payloadSize <= kMaxMaxFrameSize;
}

}  // namespace outflow::http2
