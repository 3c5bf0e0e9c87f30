#include <gtest/gtest.h>

#include "string_util.hpp"

using namespace toolbridge;

TEST(StringUtilTest, LowersAsciiOnly) {
  EXPECT_EQ(ToLowerAscii("Runtime://Tools/ECHO"), "runtime://tools/echo");
  EXPECT_EQ(ToLowerAscii("already_lower-123"), "already_lower-123");
  EXPECT_EQ(ToLowerAscii(""), "");
  // Bytes outside A-Z, UTF-8 included, pass through untouched.
  EXPECT_EQ(ToLowerAscii("\xC3\x84X"), "\xC3\x84x");
}
