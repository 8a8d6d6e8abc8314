#pragma once

#include "../models/label_map.hpp"
#include "../models/toc_entry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rules {

/**
 * @brief Checks whether a label keeps its children inside its section.
 *
 * Every label except SectionType::kOther is a strong container.
 */
bool IsStrongContainer(models::SectionType label);

/**
 * @brief Checks whether a child may leave its strong parent's section.
 *
 * The override table allows findings to give way to recommendations,
 * conclusions, annexes, appendix and bibliography; recommendations to
 * conclusions, annexes, appendix and bibliography; conclusions to
 * recommendations, annexes, appendix and bibliography. The override holds
 * only if the child's own keyword patterns match its title.
 *
 * @param parent Label of the closest ancestor.
 * @param child Label the entry carries on its own.
 * @param normalized_title Normalized title of the entry.
 * @return True if the child keeps its own label.
 */
bool CanOverride(models::SectionType parent, models::SectionType child,
                 const std::string &normalized_title);

/**
 * @brief Resolves one entry's label from its own label and its parent's.
 * @param current Label the entry carries on its own (kOther if unlocked).
 * @param parent Label of the closest ancestor, if any.
 * @param normalized_title Normalized title of the entry.
 * @return The resolved label.
 */
models::SectionType
ResolveHierarchyLabel(models::SectionType current,
                      std::optional<models::SectionType> parent,
                      const std::string &normalized_title);

/**
 * @brief Fills in and corrects labels using the heading hierarchy.
 *
 * Walks the entries in index order with an ancestry stack; children of a
 * strong container stay inside it unless an override applies, and unlabeled
 * children inherit their parent's label.
 *
 * @param entries The parsed TOC entries.
 * @param labels Locked labels (sparse).
 * @return Dense map with a label for every entry.
 */
models::LabelMap PropagateHierarchy(const std::vector<models::TocEntry> &entries,
                                    const models::LabelMap &labels);

} // namespace rules
