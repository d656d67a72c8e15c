#pragma once

#include <chrono>
#include <cstdint>

namespace outflow {

/// Event broadcasting configuration.
struct BroadcastConfig {
  /// Interval between two producer ticks.
  /// Default: 1 second.
  std::chrono::milliseconds period{std::chrono::seconds{1}};

  /// Maximum number of live subscribers. 0 means unlimited.
  /// Default: 1000.
  uint32_t maxSubscribers{1000};

  /// Maximum number of live subscribers sharing the same client identity. 0 means unlimited.
  /// Default: 10.
  uint32_t maxSubscribersPerClient{10};

  /// Single sends taking longer than this are logged as slow.
  /// Default: 1 second.
  std::chrono::milliseconds slowSendThreshold{std::chrono::seconds{1}};

  void validate() const;

  BroadcastConfig& withPeriod(std::chrono::milliseconds value) {
    period = value;
    return *this;
  }

  BroadcastConfig& withMaxSubscribers(uint32_t value) {
    maxSubscribers = value;
    return *this;
  }

  BroadcastConfig& withMaxSubscribersPerClient(uint32_t value) {
    maxSubscribersPerClient = value;
    return *this;
  }

  BroadcastConfig& withSlowSendThreshold(std::chrono::milliseconds value) {
    slowSendThreshold = value;
    return *this;
  }

  bool operator==(const BroadcastConfig&) const noexcept = default;
};

}  // namespace outflow
