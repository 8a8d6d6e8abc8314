#include "hierarchy.hpp"

#include "ancestry_stack.hpp"
#include "keyword_rules.hpp"

#include <map>
#include <set>

namespace rules {

using models::SectionType;

const std::map<SectionType, std::set<SectionType>> kOverrideAllowed{
    {SectionType::kFindings,
     {SectionType::kRecommendations, SectionType::kConclusions,
      SectionType::kAnnexes, SectionType::kAppendix,
      SectionType::kBibliography}},
    {SectionType::kRecommendations,
     {SectionType::kConclusions, SectionType::kAnnexes, SectionType::kAppendix,
      SectionType::kBibliography}},
    {SectionType::kConclusions,
     {SectionType::kRecommendations, SectionType::kAnnexes,
      SectionType::kAppendix, SectionType::kBibliography}},
};

bool IsStrongContainer(SectionType label) { return label != SectionType::kOther; }

bool CanOverride(SectionType parent, SectionType child,
                 const std::string &normalized_title) {
  auto it = kOverrideAllowed.find(parent);
  if (it == kOverrideAllowed.end() || it->second.count(child) == 0) {
    return false;
  }
  return KeywordRuleTable::getInstance().Matches(child, normalized_title);
}

SectionType ResolveHierarchyLabel(SectionType current,
                                  std::optional<SectionType> parent,
                                  const std::string &normalized_title) {
  if (parent.has_value() && IsStrongContainer(parent.value())) {
    if (current == parent.value()) {
      return current;
    }
    if (CanOverride(parent.value(), current, normalized_title)) {
      return current;
    }
    return parent.value();
  }
  if (current == SectionType::kOther && parent.has_value()) {
    return parent.value();
  }
  return current;
}

models::LabelMap PropagateHierarchy(const std::vector<models::TocEntry> &entries,
                                    const models::LabelMap &labels) {
  models::LabelMap resolved = labels;
  AncestryStack stack;
  for (const auto &entry : entries) {
    stack.Enter(entry.level);
    SectionType label =
        ResolveHierarchyLabel(models::LabelAt(labels, entry.index),
                              stack.Parent(), entry.normalized_title);
    resolved[entry.index] = label;
    stack.Push(entry.level, label);
  }
  return resolved;
}

} // namespace rules
