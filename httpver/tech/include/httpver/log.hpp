#pragma once

// Logging abstraction over spdlog. Call sites use httpver::log::debug(...) etc.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace httpver {

namespace log = spdlog;

}  // namespace httpver
