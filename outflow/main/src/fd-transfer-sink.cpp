#include "outflow/fd-transfer-sink.hpp"

#include <sys/types.h>
#include <unistd.h>

#include <cstddef>
#include <span>

#include "outflow/errno-throw.hpp"
#include "outflow/file.hpp"
#include "outflow/platform.hpp"
#include "outflow/sendfile.hpp"

namespace outflow {

TransferSink::ChunkResult FdTransferSink::transferFrom(const File& file, std::size_t offset, std::size_t count) {
  auto off = static_cast<off_t>(offset);
  while (true) {
    const auto ret = Sendfile(_fd, file.fd(), off, count);
    if (ret >= 0) {
      return {static_cast<std::size_t>(ret), ChunkResult::Code::Moved, 0};
    }
    const int err = LastSystemError();
    if (err == error::kInterrupted) {
      continue;
    }
    if (err == error::kWouldBlock) {
      return {0, ChunkResult::Code::Moved, 0};
    }
    if (error::IsZeroCopyUnsupported(err)) {
      return {0, ChunkResult::Code::Unsupported, err};
    }
    return {0, ChunkResult::Code::Error, err};
  }
}

void FdTransferSink::write(std::span<const std::byte> data) {
  while (!data.empty()) {
    const auto ret = ::write(_fd, data.data(), data.size());
    if (ret == -1) {
      if (LastSystemError() == error::kInterrupted) {
        continue;
      }
      throw_errno("write of {} bytes to fd # {} failed", data.size(), _fd);
    }
    data = data.subspan(static_cast<std::size_t>(ret));
  }
}

}  // namespace outflow
