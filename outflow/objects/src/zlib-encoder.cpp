#include "outflow/zlib-encoder.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <string_view>

#include "outflow/compression-failure.hpp"
#include "outflow/raw-chars.hpp"
#include "outflow/zlib-stream-raii.hpp"

namespace outflow {

void ZlibEncoder::encodeFull(std::size_t extraCapacity, std::string_view data, RawChars& buf) {
  ZStreamRAII zs(_level);

  auto& zstream = zs.stream;

  zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zstream.avail_in = static_cast<uInt>(data.size());

  const auto maxCompressedSize = static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size())));

  buf.ensureAvailableCapacity(maxCompressedSize + extraCapacity);

  const std::size_t availableCapacity = buf.availableCapacity();

  zstream.next_out = reinterpret_cast<unsigned char*>(buf.data() + buf.size());
  zstream.avail_out = static_cast<decltype(zstream.avail_out)>(availableCapacity);

  const auto rc = deflate(&zstream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    throw CompressionFailure(fmt::format("Error {} during gzip compression", rc));
  }

  buf.addSize(availableCapacity - zstream.avail_out);
}

}  // namespace outflow
