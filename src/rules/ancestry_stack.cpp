#include "ancestry_stack.hpp"

namespace rules {

void AncestryStack::Enter(int level) {
  while (!frames_.empty() && frames_.back().first >= level) {
    frames_.pop_back();
  }
}

std::optional<models::SectionType> AncestryStack::Parent() const {
  if (frames_.empty()) {
    return std::nullopt;
  }
  return frames_.back().second;
}

void AncestryStack::Push(int level, models::SectionType label) {
  frames_.emplace_back(level, label);
}

} // namespace rules
