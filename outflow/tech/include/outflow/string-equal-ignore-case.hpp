#pragma once

#include <cstddef>
#include <string_view>

#include "outflow/toupperlower.hpp"

namespace outflow {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

constexpr bool EndsWithCaseInsensitive(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && CaseInsensitiveEqual(value.substr(value.size() - suffix.size()), suffix);
}

// Position of the first occurrence of 'needle' in 'haystack', ignoring ASCII case.
// Returns std::string_view::npos if not found. An empty needle matches at position 0.
constexpr std::size_t CaseInsensitiveFind(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return std::string_view::npos;
  }
  const std::size_t last = haystack.size() - needle.size();
  for (std::size_t pos = 0; pos <= last; ++pos) {
    if (CaseInsensitiveEqual(haystack.substr(pos, needle.size()), needle)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

}  // namespace outflow
