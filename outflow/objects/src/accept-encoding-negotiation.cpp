#include "outflow/accept-encoding-negotiation.hpp"

#include <string_view>

#include "outflow/compression-capability.hpp"
#include "outflow/compression-config.hpp"
#include "outflow/encoding.hpp"
#include "outflow/string-equal-ignore-case.hpp"

namespace outflow {

EncodingSelector::EncodingSelector() noexcept
    : _capability(CompressionCapability::Process()), _enabled(CompressionConfig{}.enabled) {}

EncodingSelector::EncodingSelector(const CompressionConfig &compressionConfig, CompressionCapability capability)
    : _capability(capability), _enabled(compressionConfig.enabled) {}

Encoding EncodingSelector::negotiate(std::string_view acceptEncoding) const noexcept {
  if (!_enabled) {
    return Encoding::none;
  }

  const auto gzipPos = CaseInsensitiveFind(acceptEncoding, GetEncodingStr(Encoding::gzip));
  const auto brPos = _capability.isAvailable() ? CaseInsensitiveFind(acceptEncoding, GetEncodingStr(Encoding::br))
                                               : std::string_view::npos;

  if (brPos == std::string_view::npos) {
    return gzipPos == std::string_view::npos ? Encoding::none : Encoding::gzip;
  }
  if (gzipPos == std::string_view::npos) {
    return Encoding::br;
  }
  return brPos < gzipPos ? Encoding::br : Encoding::gzip;
}

}  // namespace outflow
