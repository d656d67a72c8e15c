#include "outflow/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>

#include "outflow/log.hpp"
#include "outflow/platform.hpp"

namespace outflow {

File::File(const char* path) : _fd(::open(path, O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    _openError = errno;
    log::error("Unable to open file '{}' (errno {}: {})", path, _openError, SystemErrorMessage(_openError));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    _openError = errno;
    log::error("Unable to stat file '{}' (errno {}: {})", path, _openError, SystemErrorMessage(_openError));
    _fd.close();
    return;
  }
  _isRegular = S_ISREG(st.st_mode);
  _fileSize = static_cast<std::size_t>(st.st_size);
}

std::size_t File::readAt(std::span<std::byte> dst, std::size_t offset) const {
  while (true) {
    const auto ret = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (ret >= 0) {
      return static_cast<std::size_t>(ret);
    }
    if (errno != error::kInterrupted) {
      return kError;
    }
  }
}

}  // namespace outflow
