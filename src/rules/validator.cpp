#include "validator.hpp"

#include "../helpers/helpers.hpp"

namespace rules {

models::SectionType EnsureLabelIsValid(std::string_view name) {
  std::string trimmed = helpers::Trim(std::string(name));
  return models::ParseSectionType(trimmed).value_or(models::SectionType::kOther);
}

models::LabelMap Validate(const std::map<std::size_t, std::string> &labels) {
  models::LabelMap validated;
  for (const auto &[index, name] : labels) {
    validated[index] = EnsureLabelIsValid(name);
  }
  return validated;
}

models::LabelMap Validate(const std::vector<models::TocEntry> &entries,
                          const models::LabelMap &labels) {
  models::LabelMap validated;
  for (const auto &entry : entries) {
    validated[entry.index] = models::LabelAt(labels, entry.index);
  }
  return validated;
}

} // namespace rules
