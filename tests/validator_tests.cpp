#include <gtest/gtest.h>

#include "../src/parser/toc_parser.hpp"
#include "../src/rules/validator.hpp"

using models::SectionType;

TEST(ValidatorTest, EnsureLabelIsValid) {
  EXPECT_EQ(rules::EnsureLabelIsValid("findings"), SectionType::kFindings);
  EXPECT_EQ(rules::EnsureLabelIsValid(" annexes \n"), SectionType::kAnnexes);
  EXPECT_EQ(rules::EnsureLabelIsValid("summary"), SectionType::kOther);
  EXPECT_EQ(rules::EnsureLabelIsValid("Findings"), SectionType::kOther);
  EXPECT_EQ(rules::EnsureLabelIsValid(""), SectionType::kOther);
}

TEST(ValidatorTest, Validate_CorrectsNamesOutsideTheTaxonomy) {
  std::map<std::size_t, std::string> named{
      {0, "front_matter"}, {1, "annex"}, {2, "conclusions"}};
  auto labels = rules::Validate(named);
  ASSERT_EQ(labels.size(), 3u);
  EXPECT_EQ(labels.at(0), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(1), SectionType::kOther);
  EXPECT_EQ(labels.at(2), SectionType::kConclusions);
}

TEST(ValidatorTest, Validate_FillsEveryEntry) {
  auto entries = parser::ParseToc("[H1] a\n[H1] b\n[H1] c\n");
  models::LabelMap sparse{{1, SectionType::kMethodology},
                          {7, SectionType::kFindings}};
  auto labels = rules::Validate(entries, sparse);
  ASSERT_EQ(labels.size(), 3u);
  EXPECT_EQ(labels.at(0), SectionType::kOther);
  EXPECT_EQ(labels.at(1), SectionType::kMethodology);
  EXPECT_EQ(labels.at(2), SectionType::kOther);
  EXPECT_EQ(labels.count(7), 0u);
}
