#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace outflow {

// Negotiated response encoding.
enum class Encoding : std::uint8_t {
  br,
  gzip,
  none,  // identity, should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Content-Encoding token for the given encoding.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {"br", "gzip", "identity"};
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

}  // namespace outflow
