#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace outflow {

// A server-sent event, serialized in the text/event-stream format.
class SseEvent {
 public:
  static constexpr std::string_view kDefaultEventType = "message";

  // Throws std::invalid_argument if 'data' is empty.
  // An empty 'eventType' means the default type, which is not emitted on the wire.
  // A non-positive 'retry' is not emitted.
  explicit SseEvent(std::string data, std::string eventType = {}, std::string id = {},
                    std::chrono::milliseconds retry = std::chrono::milliseconds{0});

  [[nodiscard]] std::string_view data() const noexcept { return _data; }

  [[nodiscard]] std::string_view eventType() const noexcept {
    return _eventType.empty() ? kDefaultEventType : std::string_view(_eventType);
  }

  [[nodiscard]] std::string_view id() const noexcept { return _id; }

  [[nodiscard]] std::chrono::milliseconds retry() const noexcept { return _retry; }

  // Wire form: optional 'event: ', 'id: ' and 'retry: ' lines, one 'data: ' line per line of data,
  // then a blank line.
  [[nodiscard]] std::string toBytes() const;

  // Comment line keeping idle connections alive.
  static constexpr std::string_view KeepaliveComment() noexcept { return ":\n"; }

  bool operator==(const SseEvent&) const noexcept = default;

 private:
  std::string _data;
  std::string _eventType;
  std::string _id;
  std::chrono::milliseconds _retry;
};

}  // namespace outflow
