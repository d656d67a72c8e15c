#include "outflow/sse-event.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace outflow {

SseEvent::SseEvent(std::string data, std::string eventType, std::string id, std::chrono::milliseconds retry)
    : _data(std::move(data)),
      _eventType(std::move(eventType)),
      _id(std::move(id)),
      _retry(retry.count() > 0 ? retry : std::chrono::milliseconds{0}) {
  if (_data.empty()) {
    throw std::invalid_argument("SSE event data cannot be empty");
  }
  if (_eventType == kDefaultEventType) {
    _eventType.clear();
  }
}

std::string SseEvent::toBytes() const {
  std::string out;
  out.reserve(_data.size() + _eventType.size() + _id.size() + 32UL);

  if (!_eventType.empty()) {
    out.append("event: ").append(_eventType).push_back('\n');
  }
  if (!_id.empty()) {
    out.append("id: ").append(_id).push_back('\n');
  }
  if (_retry.count() > 0) {
    fmt::format_to(std::back_inserter(out), "retry: {}\n", _retry.count());
  }

  // Each line of data gets its own 'data: ' field, trailing empty lines included.
  std::string_view remaining(_data);
  while (true) {
    const auto nl = remaining.find('\n');
    out.append("data: ").append(remaining.substr(0, nl)).push_back('\n');
    if (nl == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(nl + 1);
  }

  out.push_back('\n');
  return out;
}

}  // namespace outflow
