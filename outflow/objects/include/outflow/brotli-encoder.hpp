#pragma once

#include <cstddef>
#include <string_view>

#include "outflow/compression-config.hpp"
#include "outflow/encoder.hpp"
#include "outflow/raw-chars.hpp"

namespace outflow {

class BrotliEncoder final : public Encoder {
 public:
  explicit BrotliEncoder(const CompressionConfig &cfg) noexcept
      : _quality(cfg.brotli.quality), _window(cfg.brotli.window) {}

  void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars &buf) override;

 private:
  int _quality;
  int _window;
};

}  // namespace outflow
