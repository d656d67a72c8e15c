#pragma once

// Logging facade. All outflow modules log through spdlog (compiled library, external fmt).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace outflow {

namespace log = spdlog;

}  // namespace outflow
