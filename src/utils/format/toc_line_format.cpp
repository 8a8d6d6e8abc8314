#include "toc_line_format.hpp"

#include <fmt/core.h>

namespace format {

std::string FormatTocLine(const models::TocEntry &entry,
                          models::SectionType label) {
  std::string line = fmt::format("{}[H{}] {} | {}", entry.indentation,
                                 entry.level, entry.title,
                                 models::ToString(label));
  if (!entry.page.has_value()) {
    return line;
  }
  line += fmt::format(" | page {}", entry.page.value());
  if (entry.roman.has_value()) {
    line += fmt::format(" ({})", entry.roman.value());
  }
  if (entry.fm) {
    line += " [Front]";
  }
  return line;
}

std::string FormatLabelMap(const models::LabelMap &labels) {
  std::string buf;
  for (const auto &[index, label] : labels) {
    if (!buf.empty()) {
      buf += ' ';
    }
    buf += fmt::format("{}:{}", index, models::ToString(label));
  }
  return buf;
}

} // namespace format
