#pragma once

#include <optional>

namespace models {
/**
 * @struct DocumentContext
 * Caller-supplied facts about the document whose TOC is classified.
 */
struct DocumentContext {
  std::optional<int> total_pages; /**< Page count of the whole document. */

  /**
   * @brief Page number that closes the first third of the document.
   * @return total_pages / 3, or std::nullopt when the page count is unknown
   * or not positive.
   */
  std::optional<double> FirstThirdPage() const {
    if (!total_pages.has_value() || total_pages.value() <= 0) {
      return std::nullopt;
    }
    return static_cast<double>(total_pages.value()) / 3.0;
  }
};

} // namespace models
