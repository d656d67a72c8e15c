#pragma once

#include <sys/types.h>  // off_t

#include <cstddef>
#include <cstdint>

#include "outflow/platform.hpp"

namespace outflow {

// Kernel-side copy of up to `count` bytes from `inFd` (at `offset`) to `outFd`.
// On success, `offset` is advanced by the number of bytes actually sent.
//
// Returns the number of bytes transferred (>= 0) or -1 on error (errno set).
//
// Linux : wraps sendfile(2), any output descriptor (socket, pipe, regular file).
// macOS : wraps sendfile(2) with the macOS signature; output must be a socket.
int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept;

}  // namespace outflow
