#pragma once

#include <chrono>
#include <cstddef>

#include "outflow/simple-charconv.hpp"
#include "outflow/timedef.hpp"

namespace outflow {

inline constexpr std::size_t kISO8601WithMsStrLen = 24;

/// Writes the ISO 8601 UTC representation of a time point, in millisecond precision, and returns a pointer
/// after the last char written. Format is 'YYYY-MM-DDTHH:MM:SS.sssZ'.
/// The buffer should have a space of at least kISO8601WithMsStrLen chars.
constexpr auto TimeToStringISO8601UTCWithMs(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::milliseconds>(timePoint - daysFloor)};
  out = write4(out, static_cast<int>(ymd.year()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.month()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = 'T';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = '.';
  out = write3(++out, hms.subseconds().count());
  *out = 'Z';
  return ++out;
}

}  // namespace outflow
