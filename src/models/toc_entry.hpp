#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace models {
/**
 * @struct TocEntry
 * Structure representing one recognized line of a table of contents.
 */
struct TocEntry {
  std::size_t index = 0; /**< Position in parsed output, 0..N-1. */
  std::string title; /**< Title with dot leaders collapsed, trimmed. */
  std::string normalized_title; /**< Lower-cased, whitespace-collapsed title. */
  int level = 1; /**< Heading depth from the [H<n>] marker. */
  std::optional<int> page; /**< Page reference, if the line carries one. */
  std::optional<std::string> roman; /**< Parenthesized token after the page. */
  bool fm = false; /**< True when the line carries the [Front] marker. */
  std::string indentation; /**< Leading whitespace, kept for output only. */
  std::string original_line; /**< The raw line. */
};

} // namespace models
