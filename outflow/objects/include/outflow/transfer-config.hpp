#pragma once

#include <cstddef>
#include <cstdint>

namespace outflow {

/// File transfer configuration.
struct TransferConfig {
  /// Maximum number of bytes requested from the sink in a single zero-copy call.
  /// Default: 64 MiB.
  std::size_t chunkSize{64UL * 1024UL * 1024UL};

  /// Block size of the buffered fallback path (read then write).
  /// Default: 64 KiB.
  std::size_t bufferSize{64UL * 1024UL};

  /// Files strictly smaller than this go straight to the buffered path.
  /// Default: 0 (always try zero-copy first).
  uint64_t zeroCopyThreshold{0};

  /// Whether the zero-copy path is attempted at all.
  bool zeroCopyEnabled{true};

  void validate() const;

  TransferConfig& withChunkSize(std::size_t nbBytes) {
    chunkSize = nbBytes;
    return *this;
  }

  TransferConfig& withBufferSize(std::size_t nbBytes) {
    bufferSize = nbBytes;
    return *this;
  }

  TransferConfig& withZeroCopyThreshold(uint64_t nbBytes) {
    zeroCopyThreshold = nbBytes;
    return *this;
  }

  TransferConfig& withZeroCopy(bool enabled = true) {
    zeroCopyEnabled = enabled;
    return *this;
  }

  bool operator==(const TransferConfig&) const noexcept = default;
};

}  // namespace outflow
