#include "outflow/compression-capability.hpp"

#ifdef OUTFLOW_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

#include <cstdint>

#include "outflow/log.hpp"

namespace outflow {

CompressionCapability CompressionCapability::Probe() noexcept {
#ifdef OUTFLOW_ENABLE_BROTLI
  BrotliEncoderState* state = BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);
  if (state == nullptr) {
    log::warn("Brotli encoder instance creation failed, brotli compression disabled");
    return MakeUnavailable();
  }
  BrotliEncoderDestroyInstance(state);
  const uint32_t version = BrotliEncoderVersion();
  log::debug("Brotli encoder available, version {}.{}.{}", version >> 24, (version >> 12) & 0xFFF, version & 0xFFF);
  return MakeAvailable(version);
#else
  log::debug("Brotli support not compiled in");
  return MakeUnavailable();
#endif
}

const CompressionCapability& CompressionCapability::Process() noexcept {
  static const CompressionCapability kProcessCapability = Probe();
  return kProcessCapability;
}

}  // namespace outflow
