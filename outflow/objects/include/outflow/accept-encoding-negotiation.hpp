#pragma once

#include <string_view>

#include "outflow/compression-capability.hpp"
#include "outflow/compression-config.hpp"
#include "outflow/encoding.hpp"

namespace outflow {

class EncodingSelector {
 public:
  // Selector using the process-wide capability and a default configuration.
  EncodingSelector() noexcept;

  explicit EncodingSelector(const CompressionConfig &compressionConfig,
                            CompressionCapability capability = CompressionCapability::Process());

  // Select the response encoding from a raw Accept-Encoding header value.
  // Rules implemented:
  //  - case-insensitive substring search of "br" and "gzip", no token grammar and no q-values
  //  - brotli is never chosen when the backend is unavailable
  //  - both present: the one appearing first wins
  //  - none present, or compression disabled: identity (Encoding::none)
  [[nodiscard]] Encoding negotiate(std::string_view acceptEncoding) const noexcept;

  [[nodiscard]] bool isBackendAvailable() const noexcept { return _capability.isAvailable(); }

 private:
  CompressionCapability _capability;
  bool _enabled;
};

}  // namespace outflow
