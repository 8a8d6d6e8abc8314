#include <gtest/gtest.h>

#include "../src/helpers/helpers.hpp"

TEST(HelpersTest, Trim_RemovesLeadingAndTrailingWhitespace) {
  EXPECT_EQ(helpers::Trim("  \tannex 1 \r\n"), "annex 1");
  EXPECT_EQ(helpers::Trim("   "), "");
  EXPECT_EQ(helpers::Trim("a  b"), "a  b");
}

TEST(HelpersTest, NormalizeTitle_LowersAndCollapsesWhitespace) {
  EXPECT_EQ(helpers::NormalizeTitle("  EXECUTIVE \t  Summary "),
            "executive summary");
}

TEST(HelpersTest, NormalizeTitle_LowersNonAsciiLetters) {
  EXPECT_EQ(helpers::NormalizeTitle("Résumé Exécutif"), "résumé exécutif");
  EXPECT_EQ(helpers::NormalizeTitle("ВВЕДЕНИЕ"), "введение");
  EXPECT_EQ(helpers::NormalizeTitle("ÜBERBLICK"), "überblick");
}

TEST(HelpersTest, IsBlank) {
  EXPECT_TRUE(helpers::IsBlank(""));
  EXPECT_TRUE(helpers::IsBlank(" \t "));
  EXPECT_FALSE(helpers::IsBlank(" x "));
}

TEST(HelpersTest, SplitLines_StripsCarriageReturns) {
  auto lines = helpers::SplitLines("a\r\nb\n\nc");
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[1], "b");
  EXPECT_EQ(lines[2], "");
  EXPECT_EQ(lines[3], "c");
}

TEST(HelpersTest, SplitLines_EmptyText) {
  EXPECT_TRUE(helpers::SplitLines("").empty());
}
