#include "outflow/response-compressor.hpp"

#include <memory>
#include <string_view>
#include <utility>

#include "outflow/accept-encoding-negotiation.hpp"
#include "outflow/compression-capability.hpp"
#include "outflow/compression-config.hpp"
#include "outflow/compression-failure.hpp"
#include "outflow/encoder.hpp"
#include "outflow/encoding.hpp"
#include "outflow/log.hpp"
#include "outflow/raw-chars.hpp"
#include "outflow/zlib-encoder.hpp"

#ifdef OUTFLOW_ENABLE_BROTLI
#include "outflow/brotli-encoder.hpp"
#endif

namespace outflow {

namespace {

std::unique_ptr<Encoder> MakeBrotliEncoder([[maybe_unused]] const CompressionConfig &config,
                                           const CompressionCapability &capability) {
#ifdef OUTFLOW_ENABLE_BROTLI
  if (capability.isAvailable()) {
    return std::make_unique<BrotliEncoder>(config);
  }
#endif
  log::debug("Brotli backend unavailable (encoder version {})", capability.encoderVersion());
  return {};
}

}  // namespace

ResponseCompressor::ResponseCompressor(CompressionConfig config, CompressionCapability capability)
    : ResponseCompressor(config, capability, MakeBrotliEncoder(config, capability),
                         std::make_unique<ZlibEncoder>(config)) {}

ResponseCompressor::ResponseCompressor(CompressionConfig config, CompressionCapability capability,
                                       std::unique_ptr<Encoder> brotliEncoder, std::unique_ptr<Encoder> gzipEncoder)
    : _config(std::move(config)),
      _selector(_config, capability),
      _brotliEncoder(std::move(brotliEncoder)),
      _gzipEncoder(std::move(gzipEncoder)) {
  _config.validate();
}

void ResponseCompressor::compress(Encoding encoding, std::string_view body, RawChars &out) {
  switch (encoding) {
    case Encoding::br:
      if (!_selector.isBackendAvailable() || !_brotliEncoder) {
        throw CompressionFailure("Brotli compression requested but the backend is unavailable");
      }
      _brotliEncoder->encodeFull(0, body, out);
      break;
    case Encoding::gzip:
      if (!_gzipEncoder) {
        throw CompressionFailure("gzip compression requested but no encoder is configured");
      }
      _gzipEncoder->encodeFull(0, body, out);
      break;
    case Encoding::none:
      out.append(body);
      break;
    default:
      throw CompressionFailure("Unknown encoding");
  }
}

ResponseCompressor::EncodedBody ResponseCompressor::encodeBody(std::string_view acceptEncoding,
                                                               std::string_view contentType, std::string_view body,
                                                               std::string_view fileName) {
  if (!_config.enabled || !_config.isEligible(contentType, body.size(), fileName)) {
    return {Encoding::none, body};
  }

  const Encoding encoding = _selector.negotiate(acceptEncoding);
  if (encoding == Encoding::none) {
    return {Encoding::none, body};
  }

  _buf.clear();
  try {
    compress(encoding, body, _buf);
  } catch (const CompressionFailure &ex) {
    log::warn("{} compression of {} bytes failed, sending identity: {}", GetEncodingStr(encoding), body.size(),
              ex.what());
    return {Encoding::none, body};
  }
  log::trace("Compressed {} bytes to {} with {}", body.size(), _buf.size(), GetEncodingStr(encoding));
  return {encoding, std::string_view(_buf)};
}

}  // namespace outflow
