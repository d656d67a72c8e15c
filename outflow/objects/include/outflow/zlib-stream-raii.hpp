#pragma once

#include <zlib.h>

#include <cstdint>

namespace outflow {

// Owns a z_stream initialized for gzip compression (deflate with gzip wrapper).
struct ZStreamRAII {
  // Throws CompressionFailure on failure.
  explicit ZStreamRAII(int8_t level);

  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace outflow
