#pragma once

#include "../models/section_type.hpp"

#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string>
#include <vector>

namespace rules {

/**
 * @struct KeywordRule
 * A section type together with its compiled, case-insensitive patterns.
 */
struct KeywordRule {
  models::SectionType label;
  std::vector<std::unique_ptr<RE2>> patterns;
};

/**
 * @class KeywordRuleTable
 * @brief Ordered, immutable table of multilingual title patterns.
 *
 * The table is compiled once, on first use, and never changes afterwards, so
 * concurrent classifications may read it without synchronization. The order
 * of the rules is the tie-break between section types: the first rule with a
 * matching pattern wins.
 */
class KeywordRuleTable {
private:
  KeywordRuleTable();

  KeywordRuleTable(const KeywordRuleTable &other) = delete;
  KeywordRuleTable &operator=(const KeywordRuleTable &other) = delete;

public:
  /**
   * @brief Finds the first section type whose patterns match the text.
   * @param text The text to test, usually a normalized title.
   * @return The section type of the first matching rule, or std::nullopt.
   */
  std::optional<models::SectionType> FirstMatch(const std::string &text) const;

  /**
   * @brief Checks the text against the patterns of one section type.
   * @param label The section type whose patterns are tested.
   * @param text The text to test.
   * @return True if any pattern of the section type matches; false for
   * section types without patterns and for empty text.
   */
  bool Matches(models::SectionType label, const std::string &text) const;

  /**
   * @brief Checks the text against the broad explicit-annex patterns.
   * @param text The text to test.
   * @return True if the text names an annex, appendix, attachment or terms
   * of reference.
   */
  bool MatchesExplicitAnnex(const std::string &text) const;

  /**
   * @brief Returns the rules in priority order.
   */
  const std::vector<KeywordRule> &Rules() const { return rules_; }

  static const KeywordRuleTable &getInstance() {
    static const KeywordRuleTable instance;
    return instance;
  }

private:
  /**
   * @brief Compiles a list of patterns, failing fatally on any pattern RE2
   * rejects.
   */
  static std::vector<std::unique_ptr<RE2>>
  Compile(const std::vector<std::string> &patterns);

  /**
   * @brief Returns the rule for a section type, or nullptr if it has none.
   */
  const KeywordRule *Find(models::SectionType label) const;

  std::vector<KeywordRule> rules_;
  std::vector<std::unique_ptr<RE2>> explicit_annex_patterns_;
};

} // namespace rules
