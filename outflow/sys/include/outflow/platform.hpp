#pragma once

// Platform detection and portable aliases for outflow's system layer.
//
//   OUTFLOW_LINUX - defined on Linux
//   OUTFLOW_MACOS - defined on macOS / Darwin
//   OUTFLOW_POSIX - defined on both

#ifdef __linux__
#define OUTFLOW_LINUX
#define OUTFLOW_POSIX
#elifdef __APPLE__
#define OUTFLOW_MACOS
#define OUTFLOW_POSIX
#else
#error "Unsupported platform - outflow currently supports Linux and macOS"
#endif

#include <cerrno>
#include <cstring>

namespace outflow {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

inline int LastSystemError() noexcept { return errno; }

inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

namespace error {

inline constexpr int kWouldBlock = EAGAIN;
inline constexpr int kInterrupted = EINTR;
inline constexpr int kBrokenPipe = EPIPE;
inline constexpr int kConnectionReset = ECONNRESET;

// errno values meaning "this descriptor pair cannot do kernel-side copies".
constexpr bool IsZeroCopyUnsupported(int err) noexcept {
  return err == EINVAL || err == ENOSYS || err == EOPNOTSUPP;
}

}  // namespace error

}  // namespace outflow
