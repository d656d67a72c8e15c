#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "outflow/base-fd.hpp"
#include "outflow/live-connection.hpp"
#include "outflow/sse-event.hpp"

namespace outflow {

// LiveConnection over a connected stream socket, owning its descriptor.
// Any send failure (peer gone, reset...) marks the connection closed.
class FdSseConnection final : public LiveConnection {
 public:
  FdSseConnection(BaseFd fd, std::string clientIdentity) noexcept;

  [[nodiscard]] bool isOpen() const override { return _open.load(std::memory_order_acquire); }

  bool send(const SseEvent& event) override;

  // Send the keepalive comment.
  bool sendKeepalive();

  [[nodiscard]] std::string_view clientIdentity() const override { return _clientIdentity; }

  // Mark the connection closed, further sends fail. The descriptor is released on destruction.
  void close() noexcept { _open.store(false, std::memory_order_release); }

  [[nodiscard]] uint64_t eventsSent() const noexcept { return _eventsSent.load(std::memory_order_relaxed); }

  [[nodiscard]] uint64_t bytesSent() const noexcept { return _bytesSent.load(std::memory_order_relaxed); }

 private:
  bool sendAll(std::string_view data);

  BaseFd _fd;
  std::string _clientIdentity;
  std::atomic<bool> _open;
  std::atomic<uint64_t> _eventsSent{0};
  std::atomic<uint64_t> _bytesSent{0};
};

}  // namespace outflow
