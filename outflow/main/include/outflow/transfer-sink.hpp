#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "outflow/file.hpp"

namespace outflow {

// Destination of a file transfer.
class TransferSink {
 public:
  struct ChunkResult {
    enum class Code : uint8_t {
      Moved,        // 'bytesMoved' bytes were moved (possibly 0 when the sink would block)
      Unsupported,  // this sink cannot pull bytes from the file, use write() instead
      Error         // system call failure, 'errnum' is set
    };

    std::size_t bytesMoved{};
    Code code{Code::Moved};
    int errnum{};
  };

  virtual ~TransferSink() = default;

  // Zero-copy pull of at most 'count' bytes of 'file' starting at 'offset'.
  virtual ChunkResult transferFrom(const File& file, std::size_t offset, std::size_t count) = 0;

  // Buffered path: write all of 'data'. Throws std::system_error on failure.
  virtual void write(std::span<const std::byte> data) = 0;
};

}  // namespace outflow
