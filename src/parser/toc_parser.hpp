#pragma once

#include "../models/toc_entry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace parser {

/**
 * @brief Parses a single TOC line.
 *
 * Recognized grammar (case-insensitive):
 * `<indent>[H<level>] <title>[ | page <N>[ (<roman>)][ [Front]]]`.
 *
 * @param line The raw line, without its line terminator.
 * @param index The index to give the entry.
 * @return The entry, or std::nullopt when the line does not follow the
 * grammar.
 */
std::optional<models::TocEntry> ParseTocLine(const std::string &line,
                                             std::size_t index);

/**
 * @brief Parses raw TOC text into entries, one per recognized line.
 *
 * Blank lines and lines that do not follow the grammar are dropped. Entry
 * indices are contiguous and follow line order.
 *
 * @param toc_text The raw TOC text.
 * @return The parsed entries in document order.
 */
std::vector<models::TocEntry> ParseToc(const std::string &toc_text);

} // namespace parser
