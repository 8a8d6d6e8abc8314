#include "keyword_locker.hpp"

#include "keyword_rules.hpp"

namespace rules {

models::LabelMap LockKeywords(const std::vector<models::TocEntry> &entries) {
  const auto &table = KeywordRuleTable::getInstance();
  models::LabelMap locked;
  for (const auto &entry : entries) {
    if (entry.title.empty()) {
      continue;
    }
    auto label = table.FirstMatch(entry.normalized_title);
    if (label.has_value()) {
      locked[entry.index] = label.value();
    }
  }
  return locked;
}

} // namespace rules
