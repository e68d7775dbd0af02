#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "httpver/cctype.hpp"
#include "httpver/fixedcapacityvector.hpp"

namespace httpver {

// Version token of the fixed form <Prefix> DIGIT "." DIGIT (e.g. "HTTP/1.1").
// Major and minor are single decimal digits, so the textual form always spans exactly kStrLen chars.
template <const char *Prefix, class VersionInt = uint8_t>
struct MajorMinorVersion {
  static constexpr std::string_view kPrefix = Prefix;
  static constexpr std::size_t kStrLen = kPrefix.size() + 3UL;
  static constexpr std::size_t kMajorPos = kPrefix.size();
  static constexpr std::size_t kSepPos = kMajorPos + 1UL;
  static constexpr std::size_t kMinorPos = kSepPos + 1UL;
  static constexpr VersionInt kMaxDigit = 9;

  using VersionStr = FixedCapacityVector<char, kStrLen>;

  // Unchecked construction from raw parts, for versions known at the call site.
  // Both parts MUST be in [0, kMaxDigit]: nothing is validated here and out of range parts
  // produce a meaningless textual form.
  static constexpr MajorMinorVersion FromParts(VersionInt major, VersionInt minor) noexcept {
    return MajorMinorVersion{major, minor};
  }

  VersionInt major{};
  VersionInt minor{};

  // Writes the kStrLen chars of the token starting at 'out', which must have room for them.
  // Returns a pointer past the last written char.
  constexpr char *write(char *out) const noexcept {
    for (char ch : kPrefix) {
      *out++ = ch;
    }
    *out++ = DigitChar(static_cast<uint8_t>(major));
    *out++ = '.';
    *out++ = DigitChar(static_cast<uint8_t>(minor));
    return out;
  }

  // Builds a vector-like representation of the version as a string, without heap allocation.
  // You can wrap it in a std::string_view to make it printable.
  [[nodiscard]] VersionStr str() const {
    VersionStr ret(static_cast<typename VersionStr::size_type>(kStrLen));
    write(ret.data());
    return ret;
  }

  constexpr auto operator<=>(const MajorMinorVersion &) const noexcept = default;
};

// First grammar rule violated by a candidate version token, in checking order.
enum class VersionTokenDefect : uint8_t { None, BadLength, BadPrefix, BadMajor, BadSeparator, BadMinor };

constexpr std::string_view VersionTokenDefectStr(VersionTokenDefect defect) {
  switch (defect) {
    case VersionTokenDefect::None:
      return "none";
    case VersionTokenDefect::BadLength:
      return "bad length";
    case VersionTokenDefect::BadPrefix:
      return "bad prefix";
    case VersionTokenDefect::BadMajor:
      return "major is not a digit";
    case VersionTokenDefect::BadSeparator:
      return "bad separator";
    case VersionTokenDefect::BadMinor:
      return "minor is not a digit";
    default:
      std::unreachable();
  }
}

// Validates [first, last) against the version token grammar of VersionT.
// The whole range must be the token: no leading or trailing chars (including CRLF) are tolerated.
template <class VersionT>
constexpr VersionTokenDefect CheckVersionToken(const char *first, const char *last) noexcept {
  if (std::cmp_not_equal(last - first, VersionT::kStrLen)) {
    return VersionTokenDefect::BadLength;
  }
  // case-sensitive
  if (std::string_view(first, VersionT::kPrefix.size()) != VersionT::kPrefix) {
    return VersionTokenDefect::BadPrefix;
  }
  if (!isdigit(first[VersionT::kMajorPos])) {
    return VersionTokenDefect::BadMajor;
  }
  if (first[VersionT::kSepPos] != '.') {
    return VersionTokenDefect::BadSeparator;
  }
  if (!isdigit(first[VersionT::kMinorPos])) {
    return VersionTokenDefect::BadMinor;
  }
  return VersionTokenDefect::None;
}

// Parse a textual version token (e.g. "HTTP/1.1") into Version.
// Returns true on success; false if format invalid, in which case 'out' is left untouched.
template <const char *Prefix, class VersionInt>
constexpr bool ParseVersion(const char *first, const char *last, MajorMinorVersion<Prefix, VersionInt> &out) {
  using T = MajorMinorVersion<Prefix, VersionInt>;
  if (CheckVersionToken<T>(first, last) != VersionTokenDefect::None) {
    return false;
  }
  out.major = static_cast<VersionInt>(DigitValue(first[T::kMajorPos]));
  out.minor = static_cast<VersionInt>(DigitValue(first[T::kMinorPos]));
  return true;
}

}  // namespace httpver
