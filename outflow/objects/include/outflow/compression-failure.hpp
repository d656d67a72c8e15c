#pragma once

#include <stdexcept>

namespace outflow {

// A compression backend is absent or reported an error. Recoverable: callers degrade to identity encoding.
class CompressionFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace outflow
