#include <gtest/gtest.h>

#include "../src/parser/toc_parser.hpp"
#include "../src/rules/sequence_rules.hpp"

using models::SectionType;

namespace {

models::DocumentContext Pages(int total_pages) {
  models::DocumentContext context;
  context.total_pages = total_pages;
  return context;
}

} // namespace

TEST(RomanRangeTest, UsesFrontMarkedPages) {
  auto entries = parser::ParseToc("[H1] Key personnel | page 3 [Front]\n"
                                  "[H1] Contents | page 4 (i) [Front]\n"
                                  "[H1] Preface | page 9 (v)\n"
                                  "[H1] List of tables | page 7 [Front]\n");
  auto range = rules::FindRomanRange(entries);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->start, 3);
  EXPECT_EQ(range->end, 7);
}

TEST(RomanRangeTest, FallsBackToRomanTokens) {
  auto entries = parser::ParseToc("[H1] Contents | page 3 (i)\n"
                                  "[H1] List of figures | page 4 (ii)\n"
                                  "[H1] Introduction | page 9\n");
  auto range = rules::FindRomanRange(entries);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->start, 3);
  EXPECT_EQ(range->end, 4);
}

TEST(RomanRangeTest, IgnoresPageZero) {
  auto entries = parser::ParseToc("[H1] Cover | page 0 [Front]\n"
                                  "[H1] Introduction | page 2\n");
  EXPECT_FALSE(rules::FindRomanRange(entries).has_value());
  EXPECT_FALSE(rules::FindRomanRange({}).has_value());
}

class SequenceRuleEngineTest : public ::testing::Test {
protected:
  void Load(const std::string &toc) { entries_ = parser::ParseToc(toc); }

  std::vector<models::TocEntry> entries_;
};

TEST_F(SequenceRuleEngineTest, ShortDocumentIsAllExecutiveSummary) {
  Load("[H1] Background | page 1\n"
       "[H1] Findings | page 2\n"
       "[H1] Annex | page 3\n");
  models::LabelMap labels{{0, SectionType::kContext},
                          {1, SectionType::kFindings},
                          {2, SectionType::kAnnexes}};
  auto result = rules::ApplySequenceRules(entries_, labels, Pages(3));
  for (const auto &entry : entries_) {
    EXPECT_EQ(result.at(entry.index), SectionType::kExecutiveSummary);
  }
}

TEST_F(SequenceRuleEngineTest, ShortDocumentNeedsAPositivePageCount) {
  Load("[H1] Background | page 1\n");
  models::LabelMap labels{{0, SectionType::kContext}};
  for (int total_pages : {0, 4}) {
    rules::SequenceRuleEngine engine(entries_, Pages(total_pages));
    auto result = labels;
    EXPECT_FALSE(engine.ApplyShortDocumentOverride(result));
    EXPECT_EQ(result, labels);
  }
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  auto result = labels;
  EXPECT_FALSE(engine.ApplyShortDocumentOverride(result));
}

TEST_F(SequenceRuleEngineTest, FrontMatterBoundary) {
  Load("[H1] Foreword | page 5\n"
       "[H1] Acknowledgements | page 20\n"
       "[H1] List of annexes | page 4\n"
       "[H1] Annex 1 | page 25\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kFrontMatter},
                          {2, SectionType::kOther},
                          {3, SectionType::kAnnexes}};
  rules::SequenceRuleEngine engine(entries_, Pages(30));
  engine.ApplyFrontMatterBoundary(labels);
  EXPECT_EQ(labels.at(0), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(1), SectionType::kOther);
  EXPECT_EQ(labels.at(2), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(3), SectionType::kAnnexes);
}

TEST_F(SequenceRuleEngineTest, FrontMatterBoundaryNeedsPageCount) {
  Load("[H1] Acknowledgements | page 20\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyFrontMatterBoundary(labels);
  EXPECT_EQ(labels.at(0), SectionType::kFrontMatter);
}

TEST_F(SequenceRuleEngineTest, RomanRestriction) {
  Load("[H1] Foreword | page 1 [Front]\n"
       "[H1] Introduction | page 2 [Front]\n"
       "[H1] Executive summary | page 3 [Front]\n"
       "[H1] Untitled | page 2\n"
       "[H1] Context | page 5\n"
       "[H1] Findings\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kIntroduction},
                          {2, SectionType::kExecutiveSummary},
                          {4, SectionType::kContext},
                          {5, SectionType::kFindings}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  ASSERT_TRUE(engine.GetRomanRange().has_value());
  engine.ApplyRomanRestriction(labels);
  EXPECT_EQ(labels.at(1), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(2), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(3), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(4), SectionType::kContext);
  EXPECT_EQ(labels.at(5), SectionType::kFindings);
}

TEST_F(SequenceRuleEngineTest, RomanBoundaryReset) {
  Load("[H1] Contents | page 2 [Front]\n"
       "[H1] Chapter 1 | page 5\n"
       "[H1] Executive summary | page 6\n"
       "[H2] Key results | page 7\n"
       "[H1] Glossary | page 9\n"
       "[H1] Findings | page 10\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kAcronyms},
                          {2, SectionType::kIntroduction},
                          {3, SectionType::kFindings},
                          {4, SectionType::kOther},
                          {5, SectionType::kFindings}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyRomanBoundaryReset(labels);
  EXPECT_EQ(labels.at(0), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(1), SectionType::kOther);
  EXPECT_EQ(labels.at(2), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(3), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(4), SectionType::kAcronyms);
  EXPECT_EQ(labels.at(5), SectionType::kFindings);
}

TEST_F(SequenceRuleEngineTest, ExecSummaryDominatesRestOfRomanRange) {
  Load("[H1] Foreword | page 1 [Front]\n"
       "[H1] Executive summary | page 2 [Front]\n"
       "[H2] Background | page 3 [Front]\n"
       "[H1] Acronyms | page 4 [Front]\n"
       "[H1] Contents | page 5 [Front]\n"
       "[H1] Introduction | page 8\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kExecutiveSummary},
                          {2, SectionType::kContext},
                          {3, SectionType::kAcronyms},
                          {4, SectionType::kOther},
                          {5, SectionType::kIntroduction}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyExecSummaryDominance(labels);
  EXPECT_EQ(labels.at(0), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(1), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(2), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(3), SectionType::kAcronyms);
  EXPECT_EQ(labels.at(4), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(5), SectionType::kIntroduction);
}

TEST_F(SequenceRuleEngineTest, ExplicitAnnexDetection) {
  Load("[H1] Annex 1: Terms of reference\n"
       "[H1] Appendix B\n"
       "[H1] Terms of reference\n"
       "[H1] Findings\n");
  models::LabelMap labels{{0, SectionType::kFindings},
                          {1, SectionType::kFrontMatter},
                          {3, SectionType::kFindings}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyExplicitAnnexDetection(labels);
  EXPECT_EQ(labels.at(0), SectionType::kAnnexes);
  EXPECT_EQ(labels.at(1), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(2), SectionType::kAnnexes);
  EXPECT_EQ(labels.at(3), SectionType::kFindings);
}

TEST_F(SequenceRuleEngineTest, AnnexBoundary) {
  Load("[H1] a\n[H1] b\n[H1] c\n[H1] d\n[H1] e\n[H1] f\n");
  models::LabelMap labels{{0, SectionType::kFindings},
                          {1, SectionType::kAnnexes},
                          {2, SectionType::kConclusions},
                          {3, SectionType::kBibliography},
                          {4, SectionType::kOther},
                          {5, SectionType::kExecutiveSummary}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyAnnexBoundary(labels);
  EXPECT_EQ(labels.at(0), SectionType::kFindings);
  EXPECT_EQ(labels.at(1), SectionType::kAnnexes);
  EXPECT_EQ(labels.at(2), SectionType::kAnnexes);
  EXPECT_EQ(labels.at(3), SectionType::kBibliography);
  EXPECT_EQ(labels.at(4), SectionType::kOther);
  EXPECT_EQ(labels.at(5), SectionType::kAnnexes);
}

TEST_F(SequenceRuleEngineTest, ExecSummaryUniqueness) {
  Load("[H1] a\n[H1] b\n[H1] c\n[H1] d\n[H1] e\n[H1] f\n[H1] g\n");
  models::LabelMap labels{{0, SectionType::kExecutiveSummary},
                          {1, SectionType::kExecutiveSummary},
                          {2, SectionType::kIntroduction},
                          {3, SectionType::kExecutiveSummary},
                          {4, SectionType::kExecutiveSummary},
                          {6, SectionType::kExecutiveSummary}};
  rules::SequenceRuleEngine engine(entries_, models::DocumentContext{});
  engine.ApplyExecSummaryUniqueness(labels);
  EXPECT_EQ(labels.at(0), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(1), SectionType::kExecutiveSummary);
  EXPECT_EQ(labels.at(3), SectionType::kFindings);
  EXPECT_EQ(labels.at(4), SectionType::kFindings);
  EXPECT_EQ(labels.count(5), 0u);
  EXPECT_EQ(labels.at(6), SectionType::kFindings);
}

TEST_F(SequenceRuleEngineTest, FrontMatterRequiresFrontPages) {
  Load("[H1] Preface | page 20\n"
       "[H1] Foreword | page 5\n"
       "[H1] Chapter 1 | page 5\n"
       "[H1] Photo credits | page 25 [Front]\n"
       "[H1] Contents\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kFrontMatter},
                          {2, SectionType::kFrontMatter},
                          {3, SectionType::kFrontMatter},
                          {4, SectionType::kFrontMatter}};
  rules::SequenceRuleEngine engine(entries_, Pages(30));
  engine.ApplyFrontMatterRequiresFrontPages(labels);
  EXPECT_EQ(labels.at(0), SectionType::kOther);
  EXPECT_EQ(labels.at(1), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(2), SectionType::kOther);
  EXPECT_EQ(labels.at(3), SectionType::kFrontMatter);
  EXPECT_EQ(labels.at(4), SectionType::kOther);

  rules::SequenceRuleEngine no_pages(entries_, models::DocumentContext{});
  models::LabelMap kept{{0, SectionType::kFrontMatter}};
  no_pages.ApplyFrontMatterRequiresFrontPages(kept);
  EXPECT_EQ(kept.at(0), SectionType::kFrontMatter);
}

TEST_F(SequenceRuleEngineTest, WithoutPageCountOrRomanRangeOnlyOrderRulesApply) {
  Load("[H1] Preface | page 40\n"
       "[H1] Findings | page 41\n"
       "[H1] Annex A | page 50\n"
       "[H1] Recommendations | page 52\n");
  models::LabelMap labels{{0, SectionType::kFrontMatter},
                          {1, SectionType::kFindings},
                          {2, SectionType::kAnnexes},
                          {3, SectionType::kRecommendations}};
  auto result =
      rules::ApplySequenceRules(entries_, labels, models::DocumentContext{});
  EXPECT_EQ(result.at(0), SectionType::kFrontMatter);
  EXPECT_EQ(result.at(1), SectionType::kFindings);
  EXPECT_EQ(result.at(2), SectionType::kAnnexes);
  EXPECT_EQ(result.at(3), SectionType::kAnnexes);
}
