#pragma once

#include "toc_classifier.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace classifier {
/**
 * @class ChunkSectionResolver
 * @brief Finds the section type of a document chunk from a classified TOC.
 *
 * The resolver keeps a reference to the classification; the classification
 * must outlive it.
 */
class ChunkSectionResolver {
public:
  explicit ChunkSectionResolver(const Classification &classification);

  /**
   * @brief Selects the entry whose section contains a page.
   *
   * Picks the entry with the greatest page not after the chunk's page; on
   * equal pages the later entry wins. Entries without a page are ignored.
   *
   * @param page The chunk's page number.
   * @return The selected entry, or nullptr if every paged entry starts later.
   */
  const models::TocEntry *SelectByPage(int page) const;

  /**
   * @brief Selects an entry by matching the chunk's heading trail against
   * TOC titles.
   *
   * Headings are tried from the innermost (last) to the outermost. The first
   * heading equal to some normalized TOC title gives the candidates; with a
   * page, the candidate with the greatest page not after it wins (later
   * entry on ties), otherwise the last candidate.
   *
   * @param headings The chunk's heading trail, outermost first.
   * @param page The chunk's page number, if known.
   * @return The index of the selected entry, or std::nullopt.
   */
  std::optional<std::size_t>
  SelectByHeadings(const std::vector<std::string> &headings,
                   std::optional<int> page) const;

  /**
   * @brief Returns the section type of a chunk: by page first, then by
   * headings, SectionType::kOther when neither selects an entry.
   * @param page The chunk's page number, if known.
   * @param headings The chunk's heading trail, outermost first.
   */
  models::SectionType LabelFor(std::optional<int> page,
                               const std::vector<std::string> &headings) const;

private:
  const Classification &classification_;
  std::unordered_map<std::string, std::vector<std::size_t>> title_index_;
};

} // namespace classifier
