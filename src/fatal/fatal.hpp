#ifndef FATAL_TOCSEC_H
#define FATAL_TOCSEC_H

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for error handling and
 * tracing.
 *
 * The `loger` namespace provides functions for reporting fatal and non-fatal
 * errors, and for tracing classification decisions when verbose output is
 * enabled. Everything is written to stderr so that stdout carries only the
 * classified TOC.
 */
namespace loger {

/**
 * @brief Logs a fatal error with an optional additional message and exits
 * with status 1.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void fatal(const std::string_view &s1,
           const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Prints a trace message when verbose output is enabled.
 * @param message The message to print.
 */
void trace(const std::string_view &message);

/**
 * @brief Returns the number of errors reported through non_fatal so far.
 */
int ErrorCount();

} // namespace loger

#endif
