#pragma once

#include <spdlog/version.h>

#include <string_view>

#ifndef HTTPVER_VERSION_STR
#error "HTTPVER_VERSION_STR must be defined via build system"
#endif

#define HTTPVER_STRINGIFY_IMPL(x) #x
#define HTTPVER_STRINGIFY(x) HTTPVER_STRINGIFY_IMPL(x)

namespace httpver {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return HTTPVER_VERSION_STR; }

// Layout (multiline, no trailing newline):
//   httpver <version>\n
//     logging: spdlog <major>.<minor>.<patch>
constexpr std::string_view fullVersionStringView() {
  return "httpver " HTTPVER_VERSION_STR "\n  logging: spdlog " HTTPVER_STRINGIFY(SPDLOG_VER_MAJOR) "." HTTPVER_STRINGIFY(
      SPDLOG_VER_MINOR) "." HTTPVER_STRINGIFY(SPDLOG_VER_PATCH);
}

}  // namespace httpver
