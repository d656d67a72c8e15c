#pragma once

#include "outflow/sse-event.hpp"
#include "outflow/timedef.hpp"

namespace outflow {

// Event of type "time" carrying the given instant:
//   {"timestamp":"2025-01-31T12:34:56.789Z","unixTime":1738326896789}
SseEvent MakeClockEvent(SysTimePoint timePoint);

}  // namespace outflow
