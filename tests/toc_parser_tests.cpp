#include <gtest/gtest.h>

#include "../src/parser/toc_parser.hpp"

TEST(TocParserTest, ParseTocLine_FullLine) {
  auto entry = parser::ParseTocLine(
      "  [H2] 1.2 Scope of work .......... | page 12 (xii) [Front]", 7);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->index, 7u);
  EXPECT_EQ(entry->level, 2);
  EXPECT_EQ(entry->title, "1.2 Scope of work");
  EXPECT_EQ(entry->normalized_title, "1.2 scope of work");
  ASSERT_TRUE(entry->page.has_value());
  EXPECT_EQ(entry->page.value(), 12);
  ASSERT_TRUE(entry->roman.has_value());
  EXPECT_EQ(entry->roman.value(), "xii");
  EXPECT_TRUE(entry->fm);
  EXPECT_EQ(entry->indentation, "  ");
  EXPECT_EQ(entry->original_line,
            "  [H2] 1.2 Scope of work .......... | page 12 (xii) [Front]");
}

TEST(TocParserTest, ParseTocLine_WithoutPage) {
  auto entry = parser::ParseTocLine("[H2] Introduction", 0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->title, "Introduction");
  EXPECT_EQ(entry->level, 2);
  EXPECT_FALSE(entry->page.has_value());
  EXPECT_FALSE(entry->roman.has_value());
  EXPECT_FALSE(entry->fm);
  EXPECT_EQ(entry->indentation, "");
}

TEST(TocParserTest, ParseTocLine_RomanWithoutFrontMarker) {
  auto entry = parser::ParseTocLine("[H1] Contents | page 3 (i)", 0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->page.value_or(-1), 3);
  EXPECT_EQ(entry->roman.value_or(""), "i");
  EXPECT_FALSE(entry->fm);
}

TEST(TocParserTest, ParseTocLine_MarkersAreCaseInsensitive) {
  auto entry = parser::ParseTocLine("[h1] Preface | PAGE 2 [front]", 0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->title, "Preface");
  EXPECT_EQ(entry->page.value_or(-1), 2);
  EXPECT_TRUE(entry->fm);
}

TEST(TocParserTest, ParseTocLine_RejectsLinesOutsideTheGrammar) {
  EXPECT_FALSE(parser::ParseTocLine("Introduction | page 3", 0).has_value());
  EXPECT_FALSE(parser::ParseTocLine("[Hx] Introduction", 0).has_value());
  EXPECT_FALSE(parser::ParseTocLine("", 0).has_value());
  EXPECT_FALSE(
      parser::ParseTocLine("[H99999999999] Introduction", 0).has_value());
}

TEST(TocParserTest, ParseTocLine_OversizedPageIsAbsent) {
  auto entry = parser::ParseTocLine("[H1] Annex | page 99999999999", 0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->title, "Annex");
  EXPECT_FALSE(entry->page.has_value());
}

TEST(TocParserTest, ParseToc_SkipsBlankAndMalformedLines) {
  auto entries = parser::ParseToc("[H1] Foreword | page 2\n"
                                  "\n"
                                  "   \n"
                                  "not a heading\n"
                                  "[H1] Introduction | page 5\r\n"
                                  "  [H2] Purpose | page 5\n");
  ASSERT_EQ(entries.size(), 3u);
  for (std::size_t i = 0; i < entries.size(); i++) {
    EXPECT_EQ(entries[i].index, i);
  }
  EXPECT_EQ(entries[1].title, "Introduction");
  EXPECT_EQ(entries[2].indentation, "  ");
  EXPECT_EQ(entries[2].normalized_title, "purpose");
}

TEST(TocParserTest, ParseToc_EmptyText) {
  EXPECT_TRUE(parser::ParseToc("").empty());
  EXPECT_TRUE(parser::ParseToc("\n\n").empty());
}
