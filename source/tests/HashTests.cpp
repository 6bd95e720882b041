#include <d2anim/Hash.hpp>
#include <gtest/gtest.h>

namespace d2anim {
namespace {

TEST(HashIdentifier, SumsUppercasedCodePoints) {
  EXPECT_EQ(HashIdentifier("AAAAAAA"), (65 * 7) % 256);
  EXPECT_EQ(HashIdentifier("A1HTH1H"),
            ('A' + '1' + 'H' + 'T' + 'H' + '1' + 'H') % 256);
}

TEST(HashIdentifier, IgnoresCase) {
  EXPECT_EQ(HashIdentifier("a1hth1h"), HashIdentifier("A1HTH1H"));
  EXPECT_EQ(HashIdentifier("zzzzzzz"), HashIdentifier("ZZZZZZZ"));
}

TEST(HashIdentifier, OnlyLettersAreFolded) {
  // '[' follows 'Z' and '{' follows 'z'; neither is a letter
  EXPECT_EQ(HashIdentifier("["), '[');
  EXPECT_EQ(HashIdentifier("{"), '{');
  EXPECT_EQ(HashIdentifier("@"), '@');
}

TEST(HashIdentifier, EmptyIsBucketZero) { EXPECT_EQ(HashIdentifier(""), 0); }

TEST(HashIdentifier, WrapsModulo256) {
  // 0x7F * 7 = 889 = 3 * 256 + 121
  EXPECT_EQ(HashIdentifier("\x7f\x7f\x7f\x7f\x7f\x7f\x7f"), 121);
}

} // namespace
} // namespace d2anim
