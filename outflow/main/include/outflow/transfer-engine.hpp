#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "outflow/file.hpp"
#include "outflow/transfer-config.hpp"
#include "outflow/transfer-sink.hpp"
#include "outflow/transfer-stats.hpp"

namespace outflow {

enum class TransferMode : uint8_t { ZeroCopy, Buffered };

enum class TransferStatus : uint8_t { Completed, Stalled, Error };

struct TransferOutcome {
  bool operator==(const TransferOutcome&) const noexcept = default;

  TransferMode mode{TransferMode::ZeroCopy};  // mode in use when the transfer ended
  TransferStatus status{TransferStatus::Completed};
  std::size_t bytesMoved{};
};

std::string_view TransferModeName(TransferMode mode) noexcept;

std::string_view TransferStatusName(TransferStatus status) noexcept;

// Moves whole files to sinks, zero-copy first with a bounded chunk size, falling back to buffered
// reads and writes when the sink cannot do kernel-side copies.
// Stateless apart from the shared counters: any number of threads may call transfer() concurrently.
class TransferEngine {
 public:
  // Throws std::invalid_argument if the configuration is invalid.
  TransferEngine(TransferConfig config, TransferStats& stats);

  // Send the full content of 'file' to 'sink'.
  // Throws SourceUnreadableError if 'file' is not opened or is not a regular file.
  TransferOutcome transfer(const File& file, TransferSink& sink);

  // Open 'path' and send it to 'sink'.
  // Throws SourceUnreadableError if the file cannot be opened or is not a regular file.
  TransferOutcome transfer(std::string_view path, TransferSink& sink);

  [[nodiscard]] const TransferConfig& config() const noexcept { return _config; }

  [[nodiscard]] const TransferStats& stats() const noexcept { return _stats; }

 private:
  TransferConfig _config;
  TransferStats& _stats;
};

}  // namespace outflow
