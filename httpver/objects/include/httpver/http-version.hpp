#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>

#include "httpver/major-minor-version.hpp"

namespace httpver::http {

// RFC 9112 §2.3 HTTP-version = HTTP-name "/" DIGIT "." DIGIT, with a case-sensitive HTTP-name
inline constexpr char kHttpPrefix[] = "HTTP/";

using Version = MajorMinorVersion<kHttpPrefix, uint8_t>;

static_assert(Version::kStrLen == 8UL);

inline constexpr Version HTTP_0_9{0, 9};
inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Literal version with the single digit constraint checked at compile time.
template <uint8_t Major, uint8_t Minor>
consteval Version MakeHttpVersion() {
  static_assert(Major <= Version::kMaxDigit && Minor <= Version::kMaxDigit,
                "HTTP version parts must be single decimal digits");
  return Version::FromParts(Major, Minor);
}

enum class WriteStatus : uint8_t {
  Ok,
  WriteFailure  // the sink could not accept the whole token
};

// Parse an exact "HTTP/" DIGIT "." DIGIT token. The caller strips the CRLF of the start line beforehand.
// Returns std::nullopt for a malformed version.
std::optional<Version> ParseHttpVersion(std::string_view token);

std::optional<Version> ParseHttpVersion(std::span<const std::byte> bytes);

// Writes the Version::kStrLen chars of the token at the beginning of 'buf'.
// 'buf' is left untouched and WriteFailure is returned if it is too small.
WriteStatus WriteHttpVersion(Version version, std::span<char> buf);

// Writes the token to a stream sink. WriteFailure is returned if the stream is, or ends up, in a failed state.
WriteStatus WriteHttpVersion(Version version, std::ostream &os);

}  // namespace httpver::http

template <>
struct std::hash<httpver::http::Version> {
  std::size_t operator()(httpver::http::Version version) const noexcept {
    return (static_cast<std::size_t>(version.major) << 8U) | static_cast<std::size_t>(version.minor);
  }
};
