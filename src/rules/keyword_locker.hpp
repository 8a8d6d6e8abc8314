#pragma once

#include "../models/label_map.hpp"
#include "../models/toc_entry.hpp"

#include <vector>

namespace rules {

/**
 * @brief Locks a section type on every entry whose title matches the keyword
 * rule table.
 *
 * Rules are tried in table order and, inside a rule, pattern by pattern; the
 * first hit wins. Entries with an empty title or without any hit are left
 * out of the result.
 *
 * @param entries The parsed TOC entries.
 * @return Sparse map of locked labels.
 */
models::LabelMap LockKeywords(const std::vector<models::TocEntry> &entries);

} // namespace rules
