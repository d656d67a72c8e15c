#include "outflow/sendfile.hpp"

#include <cstddef>
#include <cstdint>

#include "outflow/platform.hpp"

#ifdef OUTFLOW_LINUX
#include <sys/sendfile.h>
#include <sys/types.h>
#elifdef OUTFLOW_MACOS
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#endif

namespace outflow {

int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept {
#ifdef OUTFLOW_LINUX
  static_assert(sizeof(ssize_t) <= sizeof(int64_t), "ssize_t must fit in int64_t");
  return static_cast<int64_t>(::sendfile(outFd, inFd, &offset, count));
#elifdef OUTFLOW_MACOS
  auto len = static_cast<off_t>(count);
  const int rc = ::sendfile(inFd, outFd, offset, &len, nullptr, 0);
  if (rc == -1 && len == 0) {
    return -1;
  }
  offset += len;
  return static_cast<int64_t>(len);
#endif
}

}  // namespace outflow
