#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

#include "outflow/base-fd.hpp"
#include "outflow/platform.hpp"

namespace outflow {

// Read-only file handle, the source side of a transfer.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path. Never throws on open failure: operator bool() returns false and openError()
  // gives the errno observed at open time.
  explicit File(const std::string& path) : File(path.c_str()) {}

  explicit File(std::string_view path) : File(std::string(path)) {}

  // Path must be null-terminated.
  explicit File(const char* path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // errno of the failed open (or fstat), 0 if the file was opened successfully.
  [[nodiscard]] int openError() const noexcept { return _openError; }

  // Return the file size in bytes, at the time of opening.
  [[nodiscard]] std::size_t size() const noexcept { return _fileSize; }

  // True if the opened descriptor refers to a regular file (not a directory, fifo or device).
  [[nodiscard]] bool isRegular() const noexcept { return _isRegular; }

  // Read up to dst.size() bytes starting at the given absolute offset.
  // Uses pread() so it does not modify the file's current offset, concurrent readers are safe.
  // Returns the number of bytes read (0 on EOF). Returns kError on error (errno set).
  [[nodiscard]] std::size_t readAt(std::span<std::byte> dst, std::size_t offset) const;

 private:
  friend class FdTransferSink;

  // The caller does NOT take ownership of the descriptor.
  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

  BaseFd _fd;
  std::size_t _fileSize{0};
  int _openError{0};
  bool _isRegular{false};
};

}  // namespace outflow
