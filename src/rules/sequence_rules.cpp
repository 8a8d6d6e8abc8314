#include "sequence_rules.hpp"

#include "../fatal/fatal.hpp"
#include "ancestry_stack.hpp"
#include "keyword_rules.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <set>

namespace rules {

using models::SectionType;

namespace {

const std::set<SectionType> kRomanOnlyTypes{
    SectionType::kFrontMatter,
    SectionType::kExecutiveSummary,
    SectionType::kAcronyms,
};

const std::set<SectionType> kPreContentTypes{
    SectionType::kFrontMatter,  SectionType::kExecutiveSummary,
    SectionType::kAcronyms,     SectionType::kIntroduction,
    SectionType::kContext,      SectionType::kMethodology,
    SectionType::kFindings,     SectionType::kRecommendations,
    SectionType::kConclusions,
};

bool IsAssigned(const models::LabelMap &labels, std::size_t index,
                SectionType label) {
  auto it = labels.find(index);
  return it != labels.end() && it->second == label;
}

} // namespace

std::optional<RomanRange>
FindRomanRange(const std::vector<models::TocEntry> &entries) {
  auto collect = [&entries](auto qualifies) {
    std::vector<int> pages;
    for (const auto &entry : entries) {
      if (qualifies(entry) && entry.page.has_value() && entry.page.value()) {
        pages.push_back(entry.page.value());
      }
    }
    return pages;
  };

  std::vector<int> pages =
      collect([](const models::TocEntry &entry) { return entry.fm; });
  if (pages.empty()) {
    pages = collect([](const models::TocEntry &entry) {
      return entry.roman.has_value();
    });
  }
  if (pages.empty()) {
    return std::nullopt;
  }
  auto [low, high] = std::minmax_element(pages.begin(), pages.end());
  return RomanRange{*low, *high};
}

SequenceRuleEngine::SequenceRuleEngine(
    const std::vector<models::TocEntry> &entries,
    const models::DocumentContext &context)
    : entries_(entries), context_(context),
      first_third_page_(context.FirstThirdPage()),
      roman_range_(FindRomanRange(entries)) {}

models::LabelMap SequenceRuleEngine::Apply(const models::LabelMap &labels) const {
  models::LabelMap result = labels;
  if (ApplyShortDocumentOverride(result)) {
    return result;
  }
  if (roman_range_.has_value()) {
    loger::trace(fmt::format("roman front-matter scope: pages {}..{}",
                             roman_range_->start, roman_range_->end));
  }
  ApplyFrontMatterBoundary(result);
  ApplyRomanRestriction(result);
  ApplyRomanBoundaryReset(result);
  ApplyExecSummaryDominance(result);
  // Passes 3 and 4 may have brought other labels back into the range.
  ApplyRomanRestriction(result);
  ApplyExplicitAnnexDetection(result);
  ApplyAnnexBoundary(result);
  ApplyExecSummaryUniqueness(result);
  ApplyFrontMatterRequiresFrontPages(result);
  return result;
}

bool SequenceRuleEngine::ApplyShortDocumentOverride(
    models::LabelMap &labels) const {
  if (!context_.total_pages.has_value() || context_.total_pages.value() <= 0 ||
      context_.total_pages.value() > 3) {
    return false;
  }
  loger::trace(fmt::format(
      "short document ({} pages): every entry is executive_summary",
      context_.total_pages.value()));
  for (const auto &entry : entries_) {
    labels[entry.index] = SectionType::kExecutiveSummary;
  }
  return true;
}

void SequenceRuleEngine::ApplyFrontMatterBoundary(
    models::LabelMap &labels) const {
  if (!first_third_page_.has_value()) {
    return;
  }
  const double first_third = first_third_page_.value();
  for (const auto &entry : entries_) {
    if (entry.page.has_value() && entry.page.value() > first_third &&
        IsAssigned(labels, entry.index, SectionType::kFrontMatter)) {
      labels[entry.index] = SectionType::kOther;
    }
  }

  const auto &table = KeywordRuleTable::getInstance();
  for (const auto &entry : entries_) {
    if (!entry.page.has_value() || entry.page.value() > first_third) {
      continue;
    }
    if (table.Matches(SectionType::kAnnexes, entry.normalized_title)) {
      labels[entry.index] = SectionType::kFrontMatter;
    }
  }
}

void SequenceRuleEngine::ApplyRomanRestriction(models::LabelMap &labels) const {
  if (!roman_range_.has_value()) {
    return;
  }
  for (const auto &entry : entries_) {
    if (!entry.page.has_value() || entry.page.value() > roman_range_->end) {
      continue;
    }
    auto it = labels.find(entry.index);
    if (it == labels.end() || kRomanOnlyTypes.count(it->second) == 0) {
      labels[entry.index] = SectionType::kFrontMatter;
    }
  }
}

std::optional<SectionType> SequenceRuleEngine::ResolvePostRomanLabel(
    const models::TocEntry &entry, std::optional<SectionType> parent,
    std::optional<SectionType> current) const {
  const auto &table = KeywordRuleTable::getInstance();
  if (parent == SectionType::kExecutiveSummary) {
    return SectionType::kExecutiveSummary;
  }
  if (table.Matches(SectionType::kExecutiveSummary, entry.normalized_title)) {
    return SectionType::kExecutiveSummary;
  }
  if (table.Matches(SectionType::kAcronyms, entry.normalized_title)) {
    return SectionType::kAcronyms;
  }
  if (current.has_value() && kRomanOnlyTypes.count(current.value()) != 0) {
    return SectionType::kOther;
  }
  return std::nullopt;
}

void SequenceRuleEngine::ApplyRomanBoundaryReset(
    models::LabelMap &labels) const {
  if (!roman_range_.has_value()) {
    return;
  }
  AncestryStack stack;
  for (const auto &entry : entries_) {
    stack.Enter(entry.level);
    auto it = labels.find(entry.index);
    std::optional<SectionType> current;
    if (it != labels.end()) {
      current = it->second;
    }

    if (!entry.page.has_value() || entry.page.value() <= roman_range_->end) {
      if (current.has_value()) {
        stack.Push(entry.level, current.value());
      }
      continue;
    }

    auto label = ResolvePostRomanLabel(entry, stack.Parent(), current);
    if (label.has_value()) {
      labels[entry.index] = label.value();
      stack.Push(entry.level, label.value());
    } else if (current.has_value()) {
      stack.Push(entry.level, current.value());
    }
  }
}

bool SequenceRuleEngine::InRomanRange(const models::TocEntry &entry) const {
  return roman_range_.has_value() && entry.page.has_value() &&
         entry.page.value() >= roman_range_->start &&
         entry.page.value() <= roman_range_->end;
}

void SequenceRuleEngine::ApplyExecSummaryDominance(
    models::LabelMap &labels) const {
  if (!roman_range_.has_value()) {
    return;
  }
  const auto &table = KeywordRuleTable::getInstance();

  std::optional<std::size_t> start_index;
  for (const auto &entry : entries_) {
    if (!InRomanRange(entry)) {
      continue;
    }
    if (IsAssigned(labels, entry.index, SectionType::kExecutiveSummary) ||
        table.Matches(SectionType::kExecutiveSummary, entry.normalized_title)) {
      labels[entry.index] = SectionType::kExecutiveSummary;
      start_index = entry.index + 1;
      break;
    }
  }
  if (!start_index.has_value()) {
    return;
  }

  for (const auto &entry : entries_) {
    if (!InRomanRange(entry) || entry.index < start_index.value()) {
      continue;
    }
    if (table.Matches(SectionType::kFrontMatter, entry.normalized_title)) {
      labels[entry.index] = SectionType::kFrontMatter;
    } else if (table.Matches(SectionType::kAcronyms, entry.normalized_title)) {
      labels[entry.index] = SectionType::kAcronyms;
    } else {
      labels[entry.index] = SectionType::kExecutiveSummary;
    }
  }
}

void SequenceRuleEngine::ApplyExplicitAnnexDetection(
    models::LabelMap &labels) const {
  const auto &table = KeywordRuleTable::getInstance();
  for (const auto &entry : entries_) {
    if (!table.MatchesExplicitAnnex(entry.normalized_title)) {
      continue;
    }
    if (!IsAssigned(labels, entry.index, SectionType::kFrontMatter)) {
      labels[entry.index] = SectionType::kAnnexes;
    }
  }
}

void SequenceRuleEngine::ApplyAnnexBoundary(models::LabelMap &labels) const {
  auto first_annex =
      std::find_if(entries_.begin(), entries_.end(),
                   [&labels](const models::TocEntry &entry) {
                     return IsAssigned(labels, entry.index,
                                       SectionType::kAnnexes);
                   });
  if (first_annex == entries_.end()) {
    return;
  }
  const std::size_t boundary = first_annex->index;
  loger::trace(fmt::format("annex boundary at entry {}", boundary));

  for (const auto &entry : entries_) {
    if (entry.index <= boundary) {
      continue;
    }
    auto it = labels.find(entry.index);
    if (it != labels.end() && kPreContentTypes.count(it->second) != 0) {
      it->second = SectionType::kAnnexes;
    }
  }
}

void SequenceRuleEngine::ApplyExecSummaryUniqueness(
    models::LabelMap &labels) const {
  bool has_seen_exec = false;
  bool in_exec_block = false;
  for (const auto &entry : entries_) {
    auto it = labels.find(entry.index);
    if (it != labels.end() && it->second == SectionType::kExecutiveSummary) {
      if (has_seen_exec && !in_exec_block) {
        it->second = SectionType::kFindings;
      } else {
        has_seen_exec = true;
        in_exec_block = true;
      }
    } else {
      in_exec_block = false;
    }
  }
}

void SequenceRuleEngine::ApplyFrontMatterRequiresFrontPages(
    models::LabelMap &labels) const {
  if (!first_third_page_.has_value()) {
    return;
  }
  const auto &table = KeywordRuleTable::getInstance();
  for (const auto &entry : entries_) {
    if (!IsAssigned(labels, entry.index, SectionType::kFrontMatter) ||
        entry.fm) {
      continue;
    }
    if (entry.page.has_value() &&
        entry.page.value() <= first_third_page_.value() &&
        table.Matches(SectionType::kFrontMatter, entry.normalized_title)) {
      continue;
    }
    labels[entry.index] = SectionType::kOther;
  }
}

models::LabelMap ApplySequenceRules(const std::vector<models::TocEntry> &entries,
                                    const models::LabelMap &labels,
                                    const models::DocumentContext &context) {
  SequenceRuleEngine engine(entries, context);
  return engine.Apply(labels);
}

} // namespace rules
