#pragma once
#include "launch_settings.hpp"

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating
 * launch settings.
 */
class ArgumentsParser {
public:
  /**
   * @brief Parses the command-line arguments and generates launch settings.
   *
   * Options come first; the first argument that does not start with '-'
   * names the TOC file. Options taking a value accept it attached (`-p30`)
   * or as the next argument (`-p 30`). Verbosity options set the process
   * wide verbose flags.
   *
   * @param argc The number of command-line arguments.
   * @param argv The array of command-line arguments.
   * @return The generated launch settings.
   * @throws std::runtime_error on a missing or malformed option value.
   */
  LaunchSettings Parse(int argc, char **argv);
};
