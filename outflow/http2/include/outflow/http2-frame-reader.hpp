#pragma once

#include <cstddef>
#include <span>

#include "outflow/http2-frame.hpp"
#include "outflow/raw-bytes.hpp"

namespace outflow::http2 {

// Accumulates bytes received from a connection and yields complete frames in arrival order.
// Not thread-safe, one reader per connection.
class FrameReader {
 public:
  // Append newly received bytes.
  void append(std::span<const std::byte> data);

  // Decode the next frame from buffered input.
  // Returns Truncated (input is kept) when the next frame is not complete yet, otherwise the decoded
  // Frame or UnknownFrame, whose bytes are consumed.
  [[nodiscard]] DecodeResult next();

  // Number of received bytes not yet consumed.
  [[nodiscard]] std::size_t pendingBytes() const noexcept { return _buf.size() - _readPos; }

 private:
  RawBytes _buf;
  std::size_t _readPos{};
};

}  // namespace outflow::http2
