#pragma once

#include <cstddef>
#include <string_view>

#include "outflow/internal/raw-bytes-base.hpp"

namespace outflow {

// Character buffer, used for response bodies and compressed output.
using RawChars = RawBytesBase<char, std::string_view, std::size_t>;

}  // namespace outflow
