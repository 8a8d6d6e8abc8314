#pragma once

#include "../classifier/toc_classifier.hpp"
#include "launch_settings.hpp"

#include <string>

/**
 * @brief Class representing the main processor of the program.
 */
class MainProcessor {
public:
  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program.
   */
  int main(int argc, char *argv[]);

private:
  /**
   * @brief Handles the informational launch settings.
   * @return True if the program should stop.
   */
  bool HandleLaunchSettings();

  /**
   * @brief Reads the TOC from the file named in the settings, or from stdin.
   */
  std::string ReadToc() const;

  /**
   * @brief Classifies the TOC, or restores it from the classified file.
   */
  classifier::Classification Run(const std::string &toc_text) const;

  /**
   * @brief Prints the classification in the form the settings ask for.
   */
  void Print(const classifier::Classification &classification) const;

  static std::string ReadFile(const std::string &path);

  LaunchSettings launch_settings_;
};
