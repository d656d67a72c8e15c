#include "outflow/fd-sse-connection.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "outflow/base-fd.hpp"
#include "outflow/log.hpp"
#include "outflow/platform.hpp"
#include "outflow/sse-event.hpp"

namespace outflow {

namespace {
#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif
}  // namespace

FdSseConnection::FdSseConnection(BaseFd fd, std::string clientIdentity) noexcept
    : _fd(std::move(fd)), _clientIdentity(std::move(clientIdentity)), _open(static_cast<bool>(_fd)) {}

bool FdSseConnection::send(const SseEvent& event) {
  if (!sendAll(event.toBytes())) {
    return false;
  }
  _eventsSent.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool FdSseConnection::sendKeepalive() { return sendAll(SseEvent::KeepaliveComment()); }

bool FdSseConnection::sendAll(std::string_view data) {
  if (!isOpen()) {
    return false;
  }
  while (!data.empty()) {
    const auto ret = ::send(_fd.fd(), data.data(), data.size(), kSendFlags);
    if (ret == -1) {
      const int err = LastSystemError();
      if (err == error::kInterrupted) {
        continue;
      }
      log::debug("SSE send to {} on fd # {} failed: {}", _clientIdentity, _fd.fd(), SystemErrorMessage(err));
      close();
      return false;
    }
    _bytesSent.fetch_add(static_cast<uint64_t>(ret), std::memory_order_relaxed);
    data.remove_prefix(static_cast<std::size_t>(ret));
  }
  return true;
}

}  // namespace outflow
