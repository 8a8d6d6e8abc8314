#include "verbose.hpp"

namespace utils::verbose {

bool Flags::NeedToPrintVerbose() const {
  return need_to_print_verbose_ || need_to_print_very_verbose_;
}

bool Flags::NeedToPrintVeryVerbose() const {
  return need_to_print_very_verbose_;
}

bool Flags::Active() const {
  return need_to_print_verbose_ || need_to_print_very_verbose_;
}

void Flags::Clean() {
  need_to_print_verbose_ = false;
  need_to_print_very_verbose_ = false;
}

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::SetNeedToPrintVeryVerbose() { need_to_print_very_verbose_ = true; }

} // namespace utils::verbose
