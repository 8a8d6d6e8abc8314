#pragma once

#include "../../models/label_map.hpp"
#include "../../models/toc_entry.hpp"

#include <string>

namespace format {

/**
 * @brief Renders an entry and its label as a classified TOC line.
 *
 * `<indent>[H<level>] <title> | <label>` when the entry has no page, else
 * `<indent>[H<level>] <title> | <label> | page <page>[ (<roman>)][ [Front]]`.
 *
 * @param entry The TOC entry.
 * @param label The entry's label.
 * @return The rendered line, without a line terminator.
 */
std::string FormatTocLine(const models::TocEntry &entry,
                          models::SectionType label);

/**
 * @brief Renders a label map on one line, e.g. `0:front_matter 1:other`.
 * @param labels The label map.
 * @return The rendered map.
 */
std::string FormatLabelMap(const models::LabelMap &labels);

} // namespace format
