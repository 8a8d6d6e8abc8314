#pragma once

#include "../models/section_type.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace rules {
/**
 * @class AncestryStack
 * @brief Tracks the labels of the headings that enclose the current entry.
 *
 * Entries are visited in document order. Before an entry is resolved,
 * Enter() drops every frame at the same or a deeper level, leaving only the
 * entry's ancestors; after it is resolved, Push() records it.
 */
class AncestryStack {
public:
  /**
   * @brief Pops the frames whose level is greater than or equal to the level
   * of the entry about to be resolved.
   * @param level Heading level of the entry.
   */
  void Enter(int level);

  /**
   * @brief Gets the label of the closest ancestor.
   * @return The label on top of the stack, or std::nullopt if it is empty.
   */
  std::optional<models::SectionType> Parent() const;

  /**
   * @brief Records a resolved entry.
   * @param level Heading level of the entry.
   * @param label Resolved label of the entry.
   */
  void Push(int level, models::SectionType label);

private:
  std::vector<std::pair<int, models::SectionType>> frames_;
};

} // namespace rules
