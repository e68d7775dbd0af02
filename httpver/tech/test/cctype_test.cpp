#include "httpver/cctype.hpp"

#include <gtest/gtest.h>

namespace httpver {

// Compile-time checks for constexpr behavior
static_assert(isdigit('0'), "digit compile-time");
static_assert(!isdigit('a'), "digit compile-time false");
static_assert(DigitValue('7') == 7, "digit value compile-time");
static_assert(DigitChar(3) == '3', "digit char compile-time");

TEST(Cctype, IsDigitBasic) {
  EXPECT_TRUE(isdigit('0'));
  EXPECT_TRUE(isdigit('5'));
  EXPECT_TRUE(isdigit('9'));

  EXPECT_FALSE(isdigit('/'));
  EXPECT_FALSE(isdigit(':'));
  EXPECT_FALSE(isdigit('a'));
  EXPECT_FALSE(isdigit('\0'));
  EXPECT_FALSE(isdigit(static_cast<char>(0xB9)));  // superscript one in Latin-1
}

TEST(Cctype, IsDigitExhaustive) {
  for (int ch = 0; ch < 256; ++ch) {
    const bool expected = ch >= '0' && ch <= '9';
    EXPECT_EQ(isdigit(static_cast<char>(ch)), expected) << "ch=" << ch;
  }
}

TEST(Cctype, DigitValueAndCharAreInverse) {
  for (uint8_t digit = 0; digit <= 9; ++digit) {
    const char ch = DigitChar(digit);
    EXPECT_TRUE(isdigit(ch));
    EXPECT_EQ(DigitValue(ch), digit);
  }
}

}  // namespace httpver
