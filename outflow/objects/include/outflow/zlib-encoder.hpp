#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "outflow/compression-config.hpp"
#include "outflow/encoder.hpp"
#include "outflow/raw-chars.hpp"

namespace outflow {

// gzip encoder.
class ZlibEncoder final : public Encoder {
 public:
  explicit ZlibEncoder(const CompressionConfig& cfg) noexcept : _level(cfg.zlib.level) {}

  void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) override;

 private:
  int8_t _level;
};

}  // namespace outflow
