#pragma once

#include <cstddef>
#include <string_view>

#include "outflow/raw-chars.hpp"

namespace outflow {

// One-shot body compression.
// Implementations are not thread-safe, use one encoder per thread.
// Backend errors are reported as CompressionFailure.
class Encoder {
 public:
  virtual ~Encoder() = default;

  // Compress the entire 'data' and append the result to 'buf'.
  // 'extraCapacity': additional capacity to ensure in 'buf' before encoding (to avoid multiple reallocations).
  virtual void encodeFull(std::size_t extraCapacity, std::string_view data, RawChars &buf) = 0;
};

}  // namespace outflow
