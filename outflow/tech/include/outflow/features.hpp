#pragma once

namespace outflow {

// Brotli is an optional build-time backend. Even when compiled in, its runtime availability
// is decided once by CompressionCapability::Probe().
#ifdef OUTFLOW_ENABLE_BROTLI
constexpr bool brotliEnabled() { return true; }
#else
constexpr bool brotliEnabled() { return false; }
#endif

}  // namespace outflow
