#include "outflow/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <utility>

#include "outflow/log.hpp"
#include "outflow/platform.hpp"

namespace outflow {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  while (::close(_fd) != 0) {
    const int err = errno;
    if (err == error::kInterrupted) {
      continue;
    }
    // EBADF can happen if the descriptor was closed behind our back; nothing else to do.
    log::error("close fd # {} failed: {}", _fd, SystemErrorMessage(err));
    break;
  }
  log::trace("fd # {} closed", _fd);
  _fd = kClosedFd;
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace outflow
