#pragma once

#include "../models/section_type.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rules {

/**
 * @struct PhraseSet
 * The RE2 patterns that lock one section type, in the order they are tried.
 */
struct PhraseSet {
  models::SectionType label;
  std::vector<std::string> patterns;
};

/**
 * @brief Wraps a pattern body in Unicode word boundaries.
 *
 * RE2's `\b` only knows ASCII word characters, so the boundary is spelled
 * out: letters, combining marks, digits and '_' are word characters.
 *
 * @param body The RE2 pattern to bound.
 * @return The bounded pattern.
 */
std::string Word(std::string_view body);

/**
 * @brief Builds a pattern that matches only when the whole text is the body,
 * optionally surrounded by whitespace.
 * @param body The RE2 pattern.
 * @return The anchored pattern.
 */
std::string Exact(std::string_view body);

/**
 * @brief The keyword phrases in priority order: the first section type
 * whose phrase matches a title wins.
 */
const std::vector<PhraseSet> &KeywordPhrases();

/**
 * @brief The broad annex, appendix, attachment and terms-of-reference
 * phrases used to pin explicit annex headings.
 */
const std::vector<std::string> &ExplicitAnnexPhrases();

} // namespace rules
