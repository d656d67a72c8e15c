#pragma once

#include <string_view>

#include "outflow/sse-event.hpp"

namespace outflow {

// A subscriber connection of the broadcast hub.
// isOpen() may be called concurrently with send().
class LiveConnection {
 public:
  virtual ~LiveConnection() = default;

  [[nodiscard]] virtual bool isOpen() const = 0;

  // Returns false if the event could not be sent. Exceptions are treated as failures by the hub.
  // Called with the hub's delivery lock held: must not re-enter BroadcastHub::deliver().
  virtual bool send(const SseEvent& event) = 0;

  // Identity of the remote client (typically its address), used for per-client limits.
  [[nodiscard]] virtual std::string_view clientIdentity() const = 0;
};

}  // namespace outflow
