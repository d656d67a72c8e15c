#include "outflow/clock-event.hpp"

#include <fmt/format.h>

#include <chrono>
#include <string>
#include <string_view>

#include "outflow/sse-event.hpp"
#include "outflow/timedef.hpp"
#include "outflow/timestring.hpp"

namespace outflow {

SseEvent MakeClockEvent(SysTimePoint timePoint) {
  char isoBuf[kISO8601WithMsStrLen];
  const char* isoEnd = TimeToStringISO8601UTCWithMs(timePoint, isoBuf);
  const auto unixMs = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();

  return SseEvent(fmt::format(R"({{"timestamp":"{}","unixTime":{}}})",
                              std::string_view(isoBuf, static_cast<std::string_view::size_type>(isoEnd - isoBuf)),
                              unixMs),
                  "time");
}

}  // namespace outflow
