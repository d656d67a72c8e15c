#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace outflow::test {

// Decompress a complete gzip member. Throws std::runtime_error on malformed input.
std::string GzipDecompress(std::string_view compressed);

// Decompress a complete brotli stream. Throws std::runtime_error on malformed input,
// or if brotli support is not compiled in.
std::string BrotliDecompress(std::string_view compressed);

constexpr bool HasGzipMagic(std::string_view body) {
  return body.size() >= 2 && static_cast<unsigned char>(body[0]) == 0x1F && static_cast<unsigned char>(body[1]) == 0x8B;
}

// Deterministic, highly compressible text of the given size.
std::string MakePatternedPayload(std::size_t size);

}  // namespace outflow::test
