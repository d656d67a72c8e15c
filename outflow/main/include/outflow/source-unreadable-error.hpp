#pragma once

#include <string>
#include <system_error>

namespace outflow {

// Transfer source is missing, unreadable, or not a regular file.
class SourceUnreadableError : public std::system_error {
 public:
  SourceUnreadableError(int errnum, const std::string& what)
      : std::system_error(std::error_code(errnum, std::generic_category()), what) {}
};

}  // namespace outflow
