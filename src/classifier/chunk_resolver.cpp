#include "chunk_resolver.hpp"

#include "../helpers/helpers.hpp"

#include <algorithm>

namespace classifier {

ChunkSectionResolver::ChunkSectionResolver(const Classification &classification)
    : classification_(classification) {
  for (const auto &entry : classification_.entries) {
    title_index_[entry.normalized_title].push_back(entry.index);
  }
}

const models::TocEntry *ChunkSectionResolver::SelectByPage(int page) const {
  const models::TocEntry *best = nullptr;
  for (const auto &entry : classification_.entries) {
    if (!entry.page.has_value() || entry.page.value() > page) {
      continue;
    }
    if (best == nullptr || entry.page.value() > best->page.value() ||
        (entry.page.value() == best->page.value() &&
         entry.index > best->index)) {
      best = &entry;
    }
  }
  return best;
}

std::optional<std::size_t>
ChunkSectionResolver::SelectByHeadings(const std::vector<std::string> &headings,
                                       std::optional<int> page) const {
  const std::vector<std::size_t> *candidates = nullptr;
  for (auto it = headings.rbegin(); it != headings.rend(); ++it) {
    auto found = title_index_.find(helpers::NormalizeTitle(*it));
    if (found != title_index_.end() && !found->second.empty()) {
      candidates = &found->second;
      break;
    }
  }
  if (candidates == nullptr) {
    return std::nullopt;
  }

  if (page.has_value()) {
    std::optional<std::size_t> best_index;
    int best_page = 0;
    for (std::size_t index : *candidates) {
      if (index >= classification_.entries.size()) {
        continue;
      }
      const auto &entry = classification_.entries[index];
      if (!entry.page.has_value() || entry.page.value() > page.value()) {
        continue;
      }
      if (!best_index.has_value() || entry.page.value() > best_page ||
          (entry.page.value() == best_page && index > best_index.value())) {
        best_index = index;
        best_page = entry.page.value();
      }
    }
    if (best_index.has_value()) {
      return best_index;
    }
  }
  return *std::max_element(candidates->begin(), candidates->end());
}

models::SectionType
ChunkSectionResolver::LabelFor(std::optional<int> page,
                               const std::vector<std::string> &headings) const {
  if (classification_.entries.empty() || classification_.labels.empty()) {
    return models::SectionType::kOther;
  }
  if (page.has_value()) {
    const models::TocEntry *entry = SelectByPage(page.value());
    if (entry != nullptr) {
      return models::LabelAt(classification_.labels, entry->index);
    }
  }
  auto index = SelectByHeadings(headings, page);
  if (index.has_value()) {
    return models::LabelAt(classification_.labels, index.value());
  }
  return models::SectionType::kOther;
}

} // namespace classifier
