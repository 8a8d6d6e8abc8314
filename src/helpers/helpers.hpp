#pragma once
#include <string>
#include <vector>

/**
 * @brief Namespace containing helper functions for string manipulation.
 *
 * The `helpers` namespace provides the UTF-8 aware string operations the
 * parser and the keyword matcher share.
 */
namespace helpers {

/**
 * @brief Removes leading and trailing whitespace, including Unicode spaces.
 * @param value The input string.
 * @return The trimmed string.
 */
std::string Trim(const std::string &value);

/**
 * @brief Replaces every run of whitespace with a single ASCII space.
 * @param value The input string.
 * @return The collapsed string.
 */
std::string CollapseWhitespace(const std::string &value);

/**
 * @brief Lower-cases a UTF-8 string using root-locale Unicode rules.
 * @param value The input string.
 * @return The lower-cased string.
 */
std::string ToLower(const std::string &value);

/**
 * @brief Normalizes a TOC title for comparison: lower-case, trim, collapse
 * whitespace.
 * @param title The title to normalize.
 * @return The normalized title.
 */
std::string NormalizeTitle(const std::string &title);

/**
 * @brief Checks whether a string holds nothing but whitespace.
 * @param value The string to check.
 * @return `true` if the string is empty or whitespace only.
 */
bool IsBlank(const std::string &value);

/**
 * @brief Splits text into lines on '\n', dropping a trailing '\r' from each.
 * @param text The input text.
 * @return The lines, in order. A trailing newline does not produce an extra
 * empty line.
 */
std::vector<std::string> SplitLines(const std::string &text);

} // namespace helpers
