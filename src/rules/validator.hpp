#pragma once

#include "../models/label_map.hpp"
#include "../models/toc_entry.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rules {

/**
 * @brief Maps a label name onto the taxonomy.
 * @param name The label name, surrounding whitespace ignored.
 * @return The matching section type, or SectionType::kOther for names outside
 * the taxonomy.
 */
models::SectionType EnsureLabelIsValid(std::string_view name);

/**
 * @brief Clamps a map of label names into the taxonomy.
 * @param labels Labels as free-form strings.
 * @return Typed labels; unknown names become SectionType::kOther.
 */
models::LabelMap Validate(const std::map<std::size_t, std::string> &labels);

/**
 * @brief Produces the final label map for a set of entries.
 *
 * Every entry gets exactly one label (kOther when unassigned) and indices
 * that do not belong to an entry are dropped.
 *
 * @param entries The parsed TOC entries.
 * @param labels Labels produced by the earlier stages.
 * @return Dense, taxonomy-valid label map.
 */
models::LabelMap Validate(const std::vector<models::TocEntry> &entries,
                          const models::LabelMap &labels);

} // namespace rules
