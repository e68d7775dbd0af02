#include "httpver/http-version.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>

#include "httpver/log.hpp"
#include "httpver/major-minor-version.hpp"

namespace httpver::http {

namespace {

std::optional<Version> ParseToken(const char *first, const char *last) {
  Version version;
  if (!ParseVersion(first, last, version)) {
    log::debug("Malformed HTTP version '{}' ({})", std::string_view(first, last),
               VersionTokenDefectStr(CheckVersionToken<Version>(first, last)));
    return std::nullopt;
  }
  return version;
}

}  // namespace

std::optional<Version> ParseHttpVersion(std::string_view token) {
  return ParseToken(token.data(), token.data() + token.size());
}

std::optional<Version> ParseHttpVersion(std::span<const std::byte> bytes) {
  const char *first = reinterpret_cast<const char *>(bytes.data());
  return ParseToken(first, first + bytes.size());
}

WriteStatus WriteHttpVersion(Version version, std::span<char> buf) {
  if (buf.size() < Version::kStrLen) {
    log::debug("Cannot write HTTP version in a buffer of {} bytes, {} required", buf.size(), Version::kStrLen);
    return WriteStatus::WriteFailure;
  }
  version.write(buf.data());
  return WriteStatus::Ok;
}

WriteStatus WriteHttpVersion(Version version, std::ostream &os) {
  char buf[Version::kStrLen];
  version.write(buf);
  if (!os.write(buf, static_cast<std::streamsize>(Version::kStrLen))) {
    log::debug("Output stream rejected HTTP version '{}'", std::string_view(buf, Version::kStrLen));
    return WriteStatus::WriteFailure;
  }
  return WriteStatus::Ok;
}

}  // namespace httpver::http
