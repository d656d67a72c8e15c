#include "outflow/broadcast-config.hpp"

#include <stdexcept>

namespace outflow {

void BroadcastConfig::validate() const {
  if (period.count() <= 0) {
    throw std::invalid_argument("BroadcastConfig: period must be strictly positive");
  }
  if (slowSendThreshold.count() < 0) {
    throw std::invalid_argument("BroadcastConfig: slowSendThreshold must not be negative");
  }
}

}  // namespace outflow
