#include "helpers.hpp"

#include <re2/re2.h>
#include <sstream>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace helpers {

std::string Trim(const std::string &value) {
  static const RE2 kEdges(R"(^[\s\p{Z}]+|[\s\p{Z}]+$)");
  std::string result = value;
  RE2::GlobalReplace(&result, kEdges, "");
  return result;
}

std::string CollapseWhitespace(const std::string &value) {
  static const RE2 kRuns(R"([\s\p{Z}]+)");
  std::string result = value;
  RE2::GlobalReplace(&result, kRuns, " ");
  return result;
}

std::string ToLower(const std::string &value) {
  std::string result;
  icu::UnicodeString::fromUTF8(value)
      .toLower(icu::Locale::getRoot())
      .toUTF8String(result);
  return result;
}

std::string NormalizeTitle(const std::string &title) {
  return CollapseWhitespace(Trim(ToLower(title)));
}

bool IsBlank(const std::string &value) { return Trim(value).empty(); }

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

} // namespace helpers
