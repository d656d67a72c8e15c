#include "outflow/compression-test-helpers.hpp"

#include <zconf.h>
#include <zlib.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef OUTFLOW_ENABLE_BROTLI
#include <brotli/decode.h>
#endif

namespace outflow::test {

std::string GzipDecompress(std::string_view compressed) {
  z_stream stream{};
  if (inflateInit2(&stream, MAX_WBITS + 16) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  std::string out;
  std::array<char, 16384> chunk;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef *>(chunk.data());
    stream.avail_out = static_cast<uInt>(chunk.size());
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&stream);
      throw std::runtime_error("gzip inflate failed");
    }
    out.append(chunk.data(), chunk.size() - stream.avail_out);
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      throw std::runtime_error("truncated gzip input");
    }
  }
  inflateEnd(&stream);
  return out;
}

std::string BrotliDecompress([[maybe_unused]] std::string_view compressed) {
#ifdef OUTFLOW_ENABLE_BROTLI
  BrotliDecoderState *state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (state == nullptr) {
    throw std::runtime_error("BrotliDecoderCreateInstance failed");
  }
  std::size_t availIn = compressed.size();
  const auto *nextIn = reinterpret_cast<const uint8_t *>(compressed.data());

  std::string out;
  std::array<uint8_t, 16384> chunk;
  BrotliDecoderResult res = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
  while (res == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    std::size_t availOut = chunk.size();
    uint8_t *nextOut = chunk.data();
    res = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, nullptr);
    out.append(reinterpret_cast<const char *>(chunk.data()), chunk.size() - availOut);
  }
  BrotliDecoderDestroyInstance(state);
  if (res != BROTLI_DECODER_RESULT_SUCCESS) {
    throw std::runtime_error("brotli decompression failed");
  }
  return out;
#else
  throw std::runtime_error("brotli support not compiled in");
#endif
}

std::string MakePatternedPayload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    payload.push_back(static_cast<char>('a' + static_cast<int>(pos % 13U)));
  }
  return payload;
}

}  // namespace outflow::test
