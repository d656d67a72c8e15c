#include "outflow/http2-frame-reader.hpp"

#include <cstddef>
#include <span>
#include <variant>

#include "outflow/http2-frame.hpp"

namespace outflow::http2 {

void FrameReader::append(std::span<const std::byte> data) {
  // Compact lazily, at most once per received chunk.
  if (_readPos != 0) {
    _buf.erase_front(_readPos);
    _readPos = 0;
  }
  _buf.append(data);
}

DecodeResult FrameReader::next() {
  DecodeResult result = DecodeFrame(std::span<const std::byte>(_buf).subspan(_readPos));
  if (const auto* frame = std::get_if<Frame>(&result)) {
    _readPos += frame->wireSize();
  } else if (const auto* unknown = std::get_if<UnknownFrame>(&result)) {
    _readPos += unknown->wireSize();
  }
  return result;
}

}  // namespace outflow::http2
