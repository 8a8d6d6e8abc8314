#pragma once

#include "section_type.hpp"

#include <cstddef>
#include <map>

namespace models {

/**
 * @brief Mapping from TOC entry index to its section type.
 *
 * Iteration follows entry order. Indices missing from the map are treated as
 * SectionType::kOther.
 */
using LabelMap = std::map<std::size_t, SectionType>;

/**
 * @brief Returns the label assigned to an index.
 * @param labels The label map.
 * @param index The entry index.
 * @return The assigned label, or SectionType::kOther when unassigned.
 */
inline SectionType LabelAt(const LabelMap &labels, std::size_t index) {
  auto it = labels.find(index);
  return it == labels.end() ? SectionType::kOther : it->second;
}

} // namespace models
