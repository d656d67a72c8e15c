#include "outflow/transfer-config.hpp"

#include <stdexcept>

namespace outflow {

void TransferConfig::validate() const {
  if (chunkSize == 0) {
    throw std::invalid_argument("TransferConfig: chunkSize must be greater than 0");
  }
  if (bufferSize == 0) {
    throw std::invalid_argument("TransferConfig: bufferSize must be greater than 0");
  }
}

}  // namespace outflow
