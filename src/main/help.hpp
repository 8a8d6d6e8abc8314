#pragma once

/**
 * @brief Prints the usage text to stdout.
 */
void PrintHelp();

/**
 * @brief Prints the program version to stdout.
 */
void PrintVersion();
