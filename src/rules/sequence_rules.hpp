#pragma once

#include "../models/document_context.hpp"
#include "../models/label_map.hpp"
#include "../models/toc_entry.hpp"

#include <optional>
#include <vector>

namespace rules {

/**
 * @struct RomanRange
 * Page span of the front-matter block, inclusive on both ends.
 */
struct RomanRange {
  int start;
  int end;
};

/**
 * @brief Finds the page span of the front-matter block.
 *
 * Uses the pages of entries carrying the [Front] marker; when no entry
 * carries it, the pages of entries with a parenthesized roman token. Entries
 * without a page, or on page 0, do not count.
 *
 * @param entries The parsed TOC entries.
 * @return The minimum and maximum page, or std::nullopt if no entry
 * qualifies.
 */
std::optional<RomanRange>
FindRomanRange(const std::vector<models::TocEntry> &entries);

/**
 * @class SequenceRuleEngine
 * @brief Structural corrections that need the whole document in view.
 *
 * The passes run in a fixed order and each one relies on the corrections of
 * the ones before it. Page-dependent passes do nothing when the page count
 * is unknown; roman-range passes do nothing without a roman range.
 */
class SequenceRuleEngine {
public:
  /**
   * @brief Constructs an engine for one document.
   * @param entries The parsed TOC entries; must outlive the engine.
   * @param context Caller-supplied document facts.
   */
  SequenceRuleEngine(const std::vector<models::TocEntry> &entries,
                     const models::DocumentContext &context);

  /**
   * @brief Runs every pass in order.
   * @param labels Hierarchy-resolved labels.
   * @return The corrected labels.
   */
  models::LabelMap Apply(const models::LabelMap &labels) const;

  /**
   * @brief Pass 0: documents of one to three pages are executive summaries.
   * @return True if the override fired; no other pass runs after it.
   */
  bool ApplyShortDocumentOverride(models::LabelMap &labels) const;

  /**
   * @brief Pass 1: front matter cannot sit past the first third; annex
   * titles listed inside the first third are front matter.
   */
  void ApplyFrontMatterBoundary(models::LabelMap &labels) const;

  /**
   * @brief Passes 2 and 5: inside the roman range only front matter,
   * executive summary and acronyms are allowed; anything else becomes front
   * matter.
   */
  void ApplyRomanRestriction(models::LabelMap &labels) const;

  /**
   * @brief Pass 3: past the roman range, roman-only labels survive only
   * under an executive-summary parent or by keyword.
   */
  void ApplyRomanBoundaryReset(models::LabelMap &labels) const;

  /**
   * @brief Pass 4: once the executive summary starts inside the roman range,
   * the rest of the range belongs to it except front matter and acronyms.
   */
  void ApplyExecSummaryDominance(models::LabelMap &labels) const;

  /**
   * @brief Pass 6: titles that name an annex are annexes unless they are
   * front matter.
   */
  void ApplyExplicitAnnexDetection(models::LabelMap &labels) const;

  /**
   * @brief Pass 7: after the first annex no pre-content label may appear.
   */
  void ApplyAnnexBoundary(models::LabelMap &labels) const;

  /**
   * @brief Pass 8: only the first contiguous executive-summary block keeps
   * its label; later ones become findings.
   */
  void ApplyExecSummaryUniqueness(models::LabelMap &labels) const;

  /**
   * @brief Pass 9: front matter must be marked [Front], or be a
   * front-matter title within the first third of the document.
   */
  void ApplyFrontMatterRequiresFrontPages(models::LabelMap &labels) const;

  const std::optional<RomanRange> &GetRomanRange() const {
    return roman_range_;
  }

private:
  bool InRomanRange(const models::TocEntry &entry) const;

  std::optional<models::SectionType>
  ResolvePostRomanLabel(const models::TocEntry &entry,
                        std::optional<models::SectionType> parent,
                        std::optional<models::SectionType> current) const;

  const std::vector<models::TocEntry> &entries_;
  models::DocumentContext context_;
  std::optional<double> first_third_page_;
  std::optional<RomanRange> roman_range_;
};

/**
 * @brief Applies the sequence rules to a label map.
 * @param entries The parsed TOC entries.
 * @param labels Hierarchy-resolved labels.
 * @param context Caller-supplied document facts.
 * @return The corrected labels.
 */
models::LabelMap ApplySequenceRules(const std::vector<models::TocEntry> &entries,
                                    const models::LabelMap &labels,
                                    const models::DocumentContext &context);

} // namespace rules
