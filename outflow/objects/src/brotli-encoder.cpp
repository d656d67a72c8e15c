#include "outflow/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "outflow/compression-failure.hpp"
#include "outflow/raw-chars.hpp"

namespace outflow {

void BrotliEncoder::encodeFull(std::size_t extraCapacity, std::string_view data, RawChars &buf) {
  const auto oldSize = buf.size();
  const std::size_t maxCompressedSize = BrotliEncoderMaxCompressedSize(data.size());
  if (maxCompressedSize == 0) {
    throw CompressionFailure("Brotli input too large");
  }

  buf.ensureAvailableCapacity(maxCompressedSize + extraCapacity);

  auto *dst = reinterpret_cast<uint8_t *>(buf.data() + oldSize);
  std::size_t outSize = maxCompressedSize;

  if (BrotliEncoderCompress(_quality, _window, BROTLI_MODE_GENERIC, data.size(),
                            reinterpret_cast<const uint8_t *>(data.data()), &outSize, dst) == BROTLI_FALSE) {
    throw CompressionFailure("BrotliEncoderCompress failed");
  }

  buf.setSize(oldSize + outSize);
}

}  // namespace outflow
