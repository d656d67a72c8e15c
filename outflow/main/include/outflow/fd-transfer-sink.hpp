#pragma once

#include <cstddef>
#include <span>

#include "outflow/file.hpp"
#include "outflow/platform.hpp"
#include "outflow/transfer-sink.hpp"

namespace outflow {

// Sink writing to a descriptor (socket, pipe or regular file) with sendfile(2) for the zero-copy path.
// The descriptor is not owned and should be in blocking mode.
class FdTransferSink final : public TransferSink {
 public:
  explicit FdTransferSink(NativeHandle fd) noexcept : _fd(fd) {}

  ChunkResult transferFrom(const File& file, std::size_t offset, std::size_t count) override;

  void write(std::span<const std::byte> data) override;

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

 private:
  NativeHandle _fd;
};

}  // namespace outflow
