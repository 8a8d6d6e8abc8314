#include "toc_parser.hpp"

#include "../helpers/helpers.hpp"

#include <charconv>
#include <re2/re2.h>

namespace parser {

namespace {

RE2::Options CaseInsensitive() {
  RE2::Options options;
  options.set_case_sensitive(false);
  return options;
}

std::optional<int> ToInt(const std::string &digits) {
  int value = 0;
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (error != std::errc() || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return value;
}

std::string CleanTitle(const std::string &raw_title) {
  static const RE2 kDotLeaders(R"(\.{2,})");
  std::string title = helpers::Trim(raw_title);
  RE2::GlobalReplace(&title, kDotLeaders, " ");
  return helpers::Trim(title);
}

} // namespace

std::optional<models::TocEntry> ParseTocLine(const std::string &line,
                                             std::size_t index) {
  static const RE2 kTocLine(
      R"((\s*)\[H(\d+)\]\s*(.*?))"
      R"((?:\s*\|\s*page\s*(\d+)(?:\s*\(([^)]+)\))?\s*(\[Front\])?)?\s*)",
      CaseInsensitive());

  std::string indent, level_text, raw_title, page_text, roman_text, fm_marker;
  if (!RE2::FullMatch(line, kTocLine, &indent, &level_text, &raw_title,
                      &page_text, &roman_text, &fm_marker)) {
    return std::nullopt;
  }
  auto level = ToInt(level_text);
  if (!level.has_value()) {
    return std::nullopt;
  }

  models::TocEntry entry;
  entry.index = index;
  entry.title = CleanTitle(raw_title);
  entry.normalized_title = helpers::NormalizeTitle(entry.title);
  entry.level = level.value();
  if (!page_text.empty()) {
    entry.page = ToInt(page_text);
  }
  std::string roman = helpers::Trim(roman_text);
  if (!roman.empty()) {
    entry.roman = roman;
  }
  entry.fm = !fm_marker.empty();
  entry.indentation = indent;
  entry.original_line = line;
  return entry;
}

std::vector<models::TocEntry> ParseToc(const std::string &toc_text) {
  std::vector<models::TocEntry> entries;
  for (const auto &line : helpers::SplitLines(toc_text)) {
    if (helpers::IsBlank(line)) {
      continue;
    }
    auto entry = ParseTocLine(line, entries.size());
    if (entry.has_value()) {
      entries.push_back(std::move(entry.value()));
    }
  }
  return entries;
}

} // namespace parser
