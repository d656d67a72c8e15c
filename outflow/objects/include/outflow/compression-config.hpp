#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef OUTFLOW_ENABLE_BROTLI
#include <brotli/encode.h>
#endif

namespace outflow {

// Response compression policy.
struct CompressionConfig {
  void validate() const;

  // True if a body of this content type, size and (optional) file name should be compressed:
  //  - size >= minBytes
  //  - content type matches one of contentTypeAllowList prefixes (case-insensitive), or the list is empty
  //  - file name does not end with one of precompressedExtensions (images, archives, fonts...)
  [[nodiscard]] bool isEligible(std::string_view contentType, std::size_t size,
                                std::string_view fileName = {}) const noexcept;

  CompressionConfig& withEnabled(bool on = true) {
    enabled = on;
    return *this;
  }

  CompressionConfig& withMinBytes(std::size_t nbBytes) {
    minBytes = nbBytes;
    return *this;
  }

  CompressionConfig& withBrotliQuality(int8_t quality) {
    brotli.quality = quality;
    return *this;
  }

  CompressionConfig& withZlibLevel(int8_t level) {
    zlib.level = level;
    return *this;
  }

  CompressionConfig& withContentTypeAllowList(std::vector<std::string> prefixes) {
    contentTypeAllowList = std::move(prefixes);
    return *this;
  }

  CompressionConfig& withPrecompressedExtensions(std::vector<std::string> extensions) {
    precompressedExtensions = std::move(extensions);
    return *this;
  }

  // When false, negotiation always yields identity.
  bool enabled{true};

  struct Zlib {
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;

    int8_t level = kDefaultLevel;
  } zlib;

  struct Brotli {
    // Fixed speed/ratio midpoint used for all brotli responses.
    static constexpr int8_t kDefaultQuality = 4;
#ifdef OUTFLOW_ENABLE_BROTLI
    static constexpr int8_t kDefaultWindow = BROTLI_DEFAULT_WINDOW;
    static constexpr int8_t kMinQuality = BROTLI_MIN_QUALITY;
    static constexpr int8_t kMaxQuality = BROTLI_MAX_QUALITY;
    static constexpr int8_t kMinWindow = BROTLI_MIN_WINDOW_BITS;
    static constexpr int8_t kMaxWindow = BROTLI_MAX_WINDOW_BITS;
#else
    static constexpr int8_t kDefaultWindow = 0;
    static constexpr int8_t kMinQuality = 0;
    static constexpr int8_t kMaxQuality = 0;
    static constexpr int8_t kMinWindow = 0;
    static constexpr int8_t kMaxWindow = 0;
#endif
    int8_t quality = kDefaultQuality;
    int8_t window = kDefaultWindow;
  } brotli;

  // Only bodies whose (uncompressed) size is >= this threshold are compressed.
  std::size_t minBytes{256UL};

  // Content-type prefixes eligible for compression. If empty, any content type is eligible.
  std::vector<std::string> contentTypeAllowList{
      "text/html",        "text/css",        "text/javascript",       "text/plain",
      "text/xml",         "application/json", "application/javascript", "application/xml",
      "application/xhtml+xml", "application/rss+xml", "application/atom+xml"};

  // File extensions of already compressed formats, never compressed again.
  std::vector<std::string> precompressedExtensions{
      ".jpg", ".jpeg", ".png", ".gif", ".webp", ".bmp",  ".ico", ".mp4", ".webm",
      ".avi", ".mov",  ".flv", ".mp3", ".wav",  ".ogg",  ".flac", ".zip", ".gz",
      ".bz2", ".7z",   ".rar", ".tar", ".pdf",  ".woff", ".woff2"};
};

}  // namespace outflow
