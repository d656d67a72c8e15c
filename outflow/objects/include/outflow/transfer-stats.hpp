#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace outflow {

// Process-wide transfer counters.
// Updates are relaxed atomic increments, safe from any number of concurrent transfers.
class TransferStats {
 public:
  struct Snapshot {
    // Serialize this snapshot to JSON (single object).
    [[nodiscard]] std::string json_str() const;

    bool operator==(const Snapshot&) const noexcept = default;

    uint64_t transfers{};
    uint64_t bytesTransferred{};
    uint64_t errors{};
  };

  TransferStats() noexcept = default;

  TransferStats(const TransferStats&) = delete;
  TransferStats(TransferStats&&) = delete;
  TransferStats& operator=(const TransferStats&) = delete;
  TransferStats& operator=(TransferStats&&) = delete;

  ~TransferStats() = default;

  // Record one completed transfer of 'nbBytes' bytes.
  void recordCompleted(uint64_t nbBytes) noexcept {
    _transfers.fetch_add(1, std::memory_order_relaxed);
    _bytesTransferred.fetch_add(nbBytes, std::memory_order_relaxed);
  }

  void recordError() noexcept { _errors.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] uint64_t transfers() const noexcept { return _transfers.load(std::memory_order_relaxed); }

  [[nodiscard]] uint64_t bytesTransferred() const noexcept {
    return _bytesTransferred.load(std::memory_order_relaxed);
  }

  [[nodiscard]] uint64_t errors() const noexcept { return _errors.load(std::memory_order_relaxed); }

  // Fields are loaded independently, the snapshot is not atomic as a whole.
  [[nodiscard]] Snapshot snapshot() const noexcept { return {transfers(), bytesTransferred(), errors()}; }

  // Administrative reset of all counters.
  void reset() noexcept;

 private:
  std::atomic<uint64_t> _transfers{0};
  std::atomic<uint64_t> _bytesTransferred{0};
  std::atomic<uint64_t> _errors{0};
};

}  // namespace outflow
