#include "trending/core/text.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace trending::core;

TEST(TextTest, CollapseWhitespaceJoinsMultiLineTitles) {
  EXPECT_EQ(text::collapseWhitespace("\n   octo /\n\n      widget\n  "),
            "octo / widget");
  EXPECT_EQ(text::collapseWhitespace("   "), "");
  EXPECT_EQ(text::collapseWhitespace("plain"), "plain");
}

TEST(TextTest, TrimAndLower) {
  EXPECT_EQ(text::trim("  owner/repo \t\n"), "owner/repo");
  EXPECT_EQ(text::toLower("Python"), "python");
}

TEST(TextTest, Utf8PrefixCountsCodePoints) {
  EXPECT_FALSE(text::utf8PrefixBytes("abc", 3).has_value());
  EXPECT_EQ(text::utf8PrefixBytes("abcd", 3), 3u);

  // "héllo": é is two bytes.
  std::string Accented = "h\xC3\xA9llo";
  EXPECT_EQ(text::utf8PrefixBytes(Accented, 2), 3u);
  EXPECT_FALSE(text::utf8PrefixBytes(Accented, 5).has_value());
}

TEST(TextTest, PercentEncodeKeepsUnreservedAndPlus) {
  EXPECT_EQ(text::percentEncodeSegment("c++"), "c++");
  EXPECT_EQ(text::percentEncodeSegment("c#"), "c%23");
  EXPECT_EQ(text::percentEncodeSegment("visual basic"), "visual%20basic");
}

TEST(TextTest, Join) {
  EXPECT_EQ(text::join({"main", "master"}, ", "), "main, master");
  EXPECT_EQ(text::join({}, ", "), "");
}
