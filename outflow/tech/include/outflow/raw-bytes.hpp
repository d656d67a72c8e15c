#pragma once

#include <cstddef>
#include <span>

#include "outflow/internal/raw-bytes-base.hpp"

namespace outflow {

// Binary buffer, used for wire frames.
using RawBytes = RawBytesBase<std::byte, std::span<const std::byte>, std::size_t>;

}  // namespace outflow
