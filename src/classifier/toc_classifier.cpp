#include "toc_classifier.hpp"

#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"
#include "../parser/toc_parser.hpp"
#include "../rules/hierarchy.hpp"
#include "../rules/keyword_locker.hpp"
#include "../rules/sequence_rules.hpp"
#include "../rules/validator.hpp"
#include "../utils/format/toc_line_format.hpp"
#include "../utils/verbose/verbose.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <iostream>
#include <re2/re2.h>

namespace classifier {

namespace {

void TraceStage(const std::string &stage, const models::LabelMap &labels) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrintVeryVerbose()) {
    return;
  }
  std::cerr << fmt::format("tocsec: {:<10} {}", stage,
                           format::FormatLabelMap(labels))
            << std::endl;
}

std::optional<models::SectionType> ReadLabel(std::string line) {
  static const RE2 kPageSuffix(
      R"(\s*\|\s*page\s*\d+(?:\s*\([^)]+\))?(?:\s*\[Front\])?\s*$)");
  RE2::Replace(&line, kPageSuffix, "");
  auto separator = line.rfind('|');
  if (separator == std::string::npos) {
    return std::nullopt;
  }
  return models::ParseSectionType(helpers::Trim(line.substr(separator + 1)));
}

} // namespace

TocClassifier::TocClassifier(const models::DocumentContext &context)
    : context_(context) {}

Classification TocClassifier::Classify(const std::string &toc_text) const {
  return Classify(parser::ParseToc(toc_text));
}

Classification
TocClassifier::Classify(std::vector<models::TocEntry> entries) const {
  Classification result;
  result.entries = std::move(entries);
  if (result.entries.empty()) {
    return result;
  }
  loger::trace(fmt::format("classifying {} TOC entries", result.entries.size()));

  models::LabelMap labels = rules::LockKeywords(result.entries);
  TraceStage("locked", labels);
  labels = rules::PropagateHierarchy(result.entries, labels);
  TraceStage("hierarchy", labels);
  labels = rules::ApplySequenceRules(result.entries, labels, context_);
  TraceStage("sequence", labels);
  result.labels = rules::Validate(result.entries, labels);
  return result;
}

std::optional<Restored>
TocClassifier::Restore(const std::string &toc_text,
                       const std::string &classified_text) const {
  static const RE2 kRomanSuffix(
      R"(\|\s*page\s*\d+\s*\([^)]+\)\s*(?:\[Front\])?\s*$)");
  static const RE2 kFrontSuffix(R"(\[Front\]\s*$)");

  auto entries = parser::ParseToc(toc_text);
  if (entries.empty()) {
    return std::nullopt;
  }
  std::vector<std::string> classified_lines;
  for (const auto &line : helpers::SplitLines(classified_text)) {
    if (!helpers::IsBlank(line)) {
      classified_lines.push_back(line);
    }
  }
  if (classified_lines.size() != entries.size()) {
    loger::trace(fmt::format(
        "classified TOC has {} lines for {} entries; not restoring",
        classified_lines.size(), entries.size()));
    return std::nullopt;
  }

  models::LabelMap stored;
  for (std::size_t i = 0; i < entries.size(); i++) {
    auto label = ReadLabel(classified_lines[i]);
    if (!label.has_value()) {
      loger::trace(fmt::format("no label on classified line {}: '{}'", i,
                               classified_lines[i]));
      return std::nullopt;
    }
    stored[entries[i].index] = label.value();
  }

  auto labels = rules::Validate(
      entries, rules::ApplySequenceRules(entries, stored, context_));

  auto any_line = [&classified_lines](const RE2 &pattern) {
    return std::any_of(classified_lines.begin(), classified_lines.end(),
                       [&pattern](const std::string &line) {
                         return RE2::PartialMatch(line, pattern);
                       });
  };
  bool has_roman_in_toc =
      std::any_of(entries.begin(), entries.end(),
                  [](const models::TocEntry &entry) { return entry.roman.has_value(); });
  bool has_fm_in_toc =
      std::any_of(entries.begin(), entries.end(),
                  [](const models::TocEntry &entry) { return entry.fm; });

  Restored restored;
  restored.needs_resave = labels != stored ||
                          (has_roman_in_toc && !any_line(kRomanSuffix)) ||
                          (has_fm_in_toc && !any_line(kFrontSuffix));
  restored.classification.entries = std::move(entries);
  restored.classification.labels = std::move(labels);
  return restored;
}

std::string TocClassifier::Render(const Classification &classification) {
  std::string text;
  for (const auto &entry : classification.entries) {
    if (!text.empty()) {
      text += '\n';
    }
    text += format::FormatTocLine(
        entry, models::LabelAt(classification.labels, entry.index));
  }
  return text;
}

std::map<std::string, models::SectionType>
TocClassifier::TitleLabels(const Classification &classification) {
  std::map<std::string, models::SectionType> titles;
  for (const auto &entry : classification.entries) {
    titles[entry.normalized_title] =
        models::LabelAt(classification.labels, entry.index);
  }
  return titles;
}

} // namespace classifier
