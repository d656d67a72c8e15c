#include "outflow/response-compressor.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "outflow/compression-capability.hpp"
#include "outflow/compression-config.hpp"
#include "outflow/compression-failure.hpp"
#include "outflow/compression-test-helpers.hpp"
#include "outflow/encoder.hpp"
#include "outflow/encoding.hpp"
#include "outflow/features.hpp"
#include "outflow/raw-chars.hpp"
#include "outflow/zlib-encoder.hpp"

namespace outflow {

namespace {

class FailingEncoder final : public Encoder {
 public:
  void encodeFull([[maybe_unused]] std::size_t extraCapacity, [[maybe_unused]] std::string_view data,
                  [[maybe_unused]] RawChars &buf) override {
    ++nbCalls;
    throw CompressionFailure("simulated backend failure");
  }

  int nbCalls{};
};

constexpr std::string_view kHtml = "text/html";

}  // namespace

TEST(ResponseCompressorTest, InvalidConfigThrows) {
  EXPECT_THROW(ResponseCompressor(CompressionConfig{}.withZlibLevel(100)), std::invalid_argument);
}

TEST(ResponseCompressorTest, GzipBody) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable());
  const std::string body = test::MakePatternedPayload(10000);

  const auto encoded = compressor.encodeBody("gzip, deflate", kHtml, body);
  ASSERT_EQ(encoded.encoding, Encoding::gzip);
  EXPECT_LT(encoded.body.size(), body.size());
  EXPECT_EQ(test::GzipDecompress(encoded.body), body);
}

TEST(ResponseCompressorTest, BrotliBody) {
  if constexpr (!brotliEnabled()) {
    GTEST_SKIP();
  }
  ResponseCompressor compressor(CompressionConfig{});
  ASSERT_TRUE(compressor.selector().isBackendAvailable());
  const std::string body = test::MakePatternedPayload(10000);

  const auto encoded = compressor.encodeBody("br;q=1.0, gzip;q=0.8", kHtml, body);
  ASSERT_EQ(encoded.encoding, Encoding::br);
  EXPECT_EQ(test::BrotliDecompress(encoded.body), body);
}

TEST(ResponseCompressorTest, UnavailableBrotliFallsBackToGzip) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable());
  const std::string body = test::MakePatternedPayload(4096);

  const auto encoded = compressor.encodeBody("br, gzip", kHtml, body);
  EXPECT_EQ(encoded.encoding, Encoding::gzip);

  const auto identity = compressor.encodeBody("br", kHtml, body);
  EXPECT_EQ(identity.encoding, Encoding::none);
  EXPECT_EQ(identity.body, body);
}

TEST(ResponseCompressorTest, CompressBrotliWhileUnavailableThrows) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable());
  RawChars out;
  EXPECT_THROW(compressor.compress(Encoding::br, "some body", out), CompressionFailure);
  EXPECT_TRUE(out.empty());
}

TEST(ResponseCompressorTest, CompressIdentityCopiesBody) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable());
  RawChars out;
  compressor.compress(Encoding::none, "plain", out);
  EXPECT_EQ(std::string_view(out), "plain");
}

TEST(ResponseCompressorTest, IneligibleBodiesAreNotCompressed) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable());
  const std::string small(100, 'a');
  const std::string large = test::MakePatternedPayload(4096);

  auto encoded = compressor.encodeBody("gzip", kHtml, small);
  EXPECT_EQ(encoded.encoding, Encoding::none);
  EXPECT_EQ(encoded.body.data(), small.data());

  encoded = compressor.encodeBody("gzip", "image/png", large);
  EXPECT_EQ(encoded.encoding, Encoding::none);

  encoded = compressor.encodeBody("gzip", "text/plain", large, "backup.tar.gz");
  EXPECT_EQ(encoded.encoding, Encoding::none);

  encoded = compressor.encodeBody("identity", kHtml, large);
  EXPECT_EQ(encoded.encoding, Encoding::none);
}

TEST(ResponseCompressorTest, DisabledCompression) {
  ResponseCompressor compressor(CompressionConfig{}.withEnabled(false), CompressionCapability::MakeUnavailable());
  const std::string body = test::MakePatternedPayload(4096);
  const auto encoded = compressor.encodeBody("gzip", kHtml, body);
  EXPECT_EQ(encoded.encoding, Encoding::none);
  EXPECT_EQ(encoded.body, body);
}

TEST(ResponseCompressorTest, BackendFailureDegradesToIdentity) {
  auto failing = std::make_unique<FailingEncoder>();
  auto *failingPtr = failing.get();
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeUnavailable(), nullptr,
                                std::move(failing));
  const std::string body = test::MakePatternedPayload(4096);

  RawChars out;
  EXPECT_THROW(compressor.compress(Encoding::gzip, body, out), CompressionFailure);

  const auto encoded = compressor.encodeBody("gzip", kHtml, body);
  EXPECT_EQ(encoded.encoding, Encoding::none);
  EXPECT_EQ(encoded.body, body);
  EXPECT_EQ(failingPtr->nbCalls, 2);
}

TEST(ResponseCompressorTest, BrotliFailureDegradesToIdentity) {
  ResponseCompressor compressor(CompressionConfig{}, CompressionCapability::MakeAvailable(1U),
                                std::make_unique<FailingEncoder>(), std::make_unique<ZlibEncoder>(CompressionConfig{}));
  const std::string body = test::MakePatternedPayload(4096);

  const auto encoded = compressor.encodeBody("br, gzip", kHtml, body);
  EXPECT_EQ(encoded.encoding, Encoding::none);
  EXPECT_EQ(encoded.body, body);

  // gzip is still fine
  const auto gzipped = compressor.encodeBody("gzip", kHtml, body);
  EXPECT_EQ(gzipped.encoding, Encoding::gzip);
  EXPECT_EQ(test::GzipDecompress(gzipped.body), body);
}

}  // namespace outflow
