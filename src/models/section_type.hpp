#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace models {

/**
 * @enum SectionType
 * @brief Closed taxonomy of structural roles a TOC heading can play.
 *
 * The declaration order is the canonical taxonomy order used when labels are
 * listed; it is not the keyword priority order.
 */
enum class SectionType {
  kFrontMatter,
  kExecutiveSummary,
  kAcronyms,
  kIntroduction,
  kContext,
  kMethodology,
  kFindings,
  kRecommendations,
  kConclusions,
  kAnnexes,
  kAppendix,
  kBibliography,
  kOther
};

/**
 * @brief All members of the taxonomy in canonical order.
 */
inline constexpr std::array<SectionType, 13> kAllSectionTypes{
    SectionType::kFrontMatter,     SectionType::kExecutiveSummary,
    SectionType::kAcronyms,        SectionType::kIntroduction,
    SectionType::kContext,         SectionType::kMethodology,
    SectionType::kFindings,        SectionType::kRecommendations,
    SectionType::kConclusions,     SectionType::kAnnexes,
    SectionType::kAppendix,        SectionType::kBibliography,
    SectionType::kOther};

/**
 * @brief Returns the wire name of a section type (e.g. "front_matter").
 * @param type The section type.
 * @return The snake_case name used in rendered TOC lines.
 */
std::string_view ToString(SectionType type);

/**
 * @brief Parses a wire name into a section type.
 * @param name The name, compared exactly (no trimming, case-sensitive).
 * @return The section type, or std::nullopt if the name is not in the
 * taxonomy.
 */
std::optional<SectionType> ParseSectionType(std::string_view name);

} // namespace models
