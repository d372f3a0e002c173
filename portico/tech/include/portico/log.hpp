#pragma once

// All portico modules log through spdlog's default logger.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace portico {

namespace log = spdlog;

}  // namespace portico
