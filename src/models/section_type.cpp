#include "section_type.hpp"

#include <string_view>
#include <unordered_map>

namespace models {

const std::unordered_map<std::string_view, SectionType> kSectionTypeNames{
    {"front_matter", SectionType::kFrontMatter},
    {"executive_summary", SectionType::kExecutiveSummary},
    {"acronyms", SectionType::kAcronyms},
    {"introduction", SectionType::kIntroduction},
    {"context", SectionType::kContext},
    {"methodology", SectionType::kMethodology},
    {"findings", SectionType::kFindings},
    {"recommendations", SectionType::kRecommendations},
    {"conclusions", SectionType::kConclusions},
    {"annexes", SectionType::kAnnexes},
    {"appendix", SectionType::kAppendix},
    {"bibliography", SectionType::kBibliography},
    {"other", SectionType::kOther},
};

std::string_view ToString(SectionType type) {
  switch (type) {
  case SectionType::kFrontMatter:
    return "front_matter";
  case SectionType::kExecutiveSummary:
    return "executive_summary";
  case SectionType::kAcronyms:
    return "acronyms";
  case SectionType::kIntroduction:
    return "introduction";
  case SectionType::kContext:
    return "context";
  case SectionType::kMethodology:
    return "methodology";
  case SectionType::kFindings:
    return "findings";
  case SectionType::kRecommendations:
    return "recommendations";
  case SectionType::kConclusions:
    return "conclusions";
  case SectionType::kAnnexes:
    return "annexes";
  case SectionType::kAppendix:
    return "appendix";
  case SectionType::kBibliography:
    return "bibliography";
  case SectionType::kOther:
    return "other";
  }
  return "other";
}

std::optional<SectionType> ParseSectionType(std::string_view name) {
  auto it = kSectionTypeNames.find(name);
  if (it == kSectionTypeNames.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace models
