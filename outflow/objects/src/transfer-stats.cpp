#include "outflow/transfer-stats.hpp"

#include <fmt/format.h>

#include <atomic>
#include <iterator>
#include <string>

namespace outflow {

std::string TransferStats::Snapshot::json_str() const {
  std::string out;
  out.reserve(96UL);
  fmt::format_to(std::back_inserter(out), R"({{"transfers":{},"bytesTransferred":{},"errors":{}}})", transfers,
                 bytesTransferred, errors);
  return out;
}

void TransferStats::reset() noexcept {
  _transfers.store(0, std::memory_order_relaxed);
  _bytesTransferred.store(0, std::memory_order_relaxed);
  _errors.store(0, std::memory_order_relaxed);
}

}  // namespace outflow
