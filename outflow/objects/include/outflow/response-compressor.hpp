#pragma once

#include <memory>
#include <string_view>

#include "outflow/accept-encoding-negotiation.hpp"
#include "outflow/compression-capability.hpp"
#include "outflow/compression-config.hpp"
#include "outflow/encoder.hpp"
#include "outflow/encoding.hpp"
#include "outflow/raw-chars.hpp"

namespace outflow {

// Applies the compression policy to response bodies.
// Holds its own encoders and output buffer: use one instance per thread.
class ResponseCompressor {
 public:
  struct EncodedBody {
    Encoding encoding{Encoding::none};
    // Either the original body or a view on the internal buffer, valid until the next call.
    std::string_view body;
  };

  // Throws std::invalid_argument if the configuration is invalid.
  explicit ResponseCompressor(CompressionConfig config,
                              CompressionCapability capability = CompressionCapability::Process());

  // Same, with explicit encoders. A null brotli encoder means the backend is absent.
  ResponseCompressor(CompressionConfig config, CompressionCapability capability,
                     std::unique_ptr<Encoder> brotliEncoder, std::unique_ptr<Encoder> gzipEncoder);

  // Encode 'body' with 'encoding' and append the result to 'out'. Encoding::none appends the body as is.
  // Throws CompressionFailure if brotli is requested while unavailable, or if the backend fails.
  void compress(Encoding encoding, std::string_view body, RawChars &out);

  // Eligibility check, negotiation and compression in one call.
  // A CompressionFailure is logged and degrades to the identity body, it is never propagated.
  [[nodiscard]] EncodedBody encodeBody(std::string_view acceptEncoding, std::string_view contentType,
                                       std::string_view body, std::string_view fileName = {});

  [[nodiscard]] const CompressionConfig &config() const noexcept { return _config; }

  [[nodiscard]] const EncodingSelector &selector() const noexcept { return _selector; }

 private:
  CompressionConfig _config;
  EncodingSelector _selector;
  std::unique_ptr<Encoder> _brotliEncoder;
  std::unique_ptr<Encoder> _gzipEncoder;
  RawChars _buf;
};

}  // namespace outflow
