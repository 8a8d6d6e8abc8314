#pragma once

#include <optional>
#include <stdexcept>
#include <string>

struct LaunchSettings {
  bool need_print_label_map = false;   // -l
  bool need_print_title_map = false;   // -t
  bool need_to_print_version_and_stop = false;
  bool need_to_print_help_and_stop = false;

  std::optional<int> total_pages;              // -p
  std::optional<int> chunk_page;               // -c
  std::optional<std::string> classified_file;  // -r
  std::optional<std::string> toc_file;         // stdin when empty

  /**
   * @brief Sets the page count of the document.
   * @param value The option argument.
   * @throws std::runtime_error if the value is not a non-negative number.
   */
  void SetTotalPages(const std::string &value);

  /**
   * @brief Sets the page of the chunk whose section type is requested.
   * @param value The option argument.
   * @throws std::runtime_error if the value is not a non-negative number.
   */
  void SetChunkPage(const std::string &value);
};
