#include "outflow/compression-config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "outflow/features.hpp"
#include "outflow/string-equal-ignore-case.hpp"

namespace outflow {

void CompressionConfig::validate() const {
  if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
    throw std::invalid_argument(fmt::format("Invalid ZLIB compression level {}", zlib.level));
  }

  if constexpr (outflow::brotliEnabled()) {
    if (brotli.quality < Brotli::kMinQuality || brotli.quality > Brotli::kMaxQuality) {
      throw std::invalid_argument(fmt::format("Invalid Brotli quality {}", brotli.quality));
    }
    if (brotli.window < Brotli::kMinWindow || brotli.window > Brotli::kMaxWindow) {
      throw std::invalid_argument(fmt::format("Invalid Brotli window {}", brotli.window));
    }
  }

  if (std::ranges::any_of(contentTypeAllowList, [](const std::string& prefix) { return prefix.empty(); })) {
    throw std::invalid_argument("Empty content type prefix in compression allow list");
  }
  if (std::ranges::any_of(precompressedExtensions,
                          [](const std::string& ext) { return ext.size() < 2 || ext.front() != '.'; })) {
    throw std::invalid_argument("Precompressed extensions should start with '.'");
  }
}

bool CompressionConfig::isEligible(std::string_view contentType, std::size_t size,
                                   std::string_view fileName) const noexcept {
  if (size < minBytes) {
    return false;
  }
  if (!contentTypeAllowList.empty() &&
      std::ranges::none_of(contentTypeAllowList, [contentType](const std::string& prefix) {
        return StartsWithCaseInsensitive(contentType, prefix);
      })) {
    return false;
  }
  return fileName.empty() || std::ranges::none_of(precompressedExtensions, [fileName](const std::string& ext) {
           return EndsWithCaseInsensitive(fileName, ext);
         });
}

}  // namespace outflow
