#pragma once

#include "../models/document_context.hpp"
#include "../models/label_map.hpp"
#include "../models/toc_entry.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace classifier {

/**
 * @struct Classification
 * Parsed TOC entries together with one valid label per entry.
 */
struct Classification {
  std::vector<models::TocEntry> entries;
  models::LabelMap labels;
};

/**
 * @struct Restored
 * Labels read back from a previously classified TOC.
 */
struct Restored {
  Classification classification;
  bool needs_resave = false; /**< The stored text is stale and should be
                                  rendered again. */
};

/**
 * @class TocClassifier
 * @brief Runs the classification pipeline for one document.
 *
 * parse -> keyword locking -> hierarchy propagation -> sequence rules ->
 * validation. The classifier holds no state besides the document context,
 * so one instance may classify any number of TOCs of the same document.
 */
class TocClassifier {
public:
  explicit TocClassifier(const models::DocumentContext &context = {});

  /**
   * @brief Parses and classifies raw TOC text.
   * @param toc_text The raw TOC text.
   * @return The entries and their labels.
   */
  Classification Classify(const std::string &toc_text) const;

  /**
   * @brief Classifies already parsed entries.
   * @param entries Entries with contiguous indices in document order.
   * @return The entries and their labels.
   */
  Classification Classify(std::vector<models::TocEntry> entries) const;

  /**
   * @brief Restores labels from a previously rendered classified TOC.
   *
   * The classified text must hold one non-blank line per parsed entry, each
   * ending in `| <label>` optionally followed by the page suffix. Sequence
   * rules are applied again to the restored labels.
   *
   * @param toc_text The raw TOC text.
   * @param classified_text The rendered classified TOC.
   * @return The restored classification, or std::nullopt if the classified
   * text does not line up with the TOC or names an unknown label.
   */
  std::optional<Restored> Restore(const std::string &toc_text,
                                  const std::string &classified_text) const;

  /**
   * @brief Renders a classification as classified TOC text, one line per
   * entry, joined by '\n'.
   */
  static std::string Render(const Classification &classification);

  /**
   * @brief Maps normalized titles to labels; on repeated titles the last
   * entry wins.
   */
  static std::map<std::string, models::SectionType>
  TitleLabels(const Classification &classification);

  const models::DocumentContext &GetContext() const { return context_; }

private:
  models::DocumentContext context_;
};

} // namespace classifier
