#include "outflow/zlib-stream-raii.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstdint>

#include "outflow/compression-failure.hpp"
#include "outflow/log.hpp"

namespace outflow {

namespace {
// +16 asks zlib for a gzip header and trailer instead of the raw zlib wrapper.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
}  // namespace

ZStreamRAII::ZStreamRAII(int8_t level) {
  const auto ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw CompressionFailure(fmt::format("Error from deflateInit2 - error {}", ret));
  }
}

ZStreamRAII::~ZStreamRAII() {
  const auto ret = deflateEnd(&stream);
  // Z_DATA_ERROR only means the stream was freed before Z_FINISH, which happens on error paths.
  if (ret != Z_OK && ret != Z_DATA_ERROR) {
    log::error("zlib: deflateEnd returned {} (ignored)", ret);
  }
}

}  // namespace outflow
