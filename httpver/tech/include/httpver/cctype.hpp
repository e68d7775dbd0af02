#pragma once

#include <cstdint>

namespace httpver {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

// Numeric value of an ASCII decimal digit. Only meaningful when isdigit(ch).
constexpr uint8_t DigitValue(char ch) { return static_cast<uint8_t>(ch - '0'); }

// ASCII character of a single decimal digit. Only meaningful for values in [0, 9].
constexpr char DigitChar(uint8_t digit) { return static_cast<char>('0' + digit); }

}  // namespace httpver
