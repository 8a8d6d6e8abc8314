#include "fatal.hpp"
#include "../utils/verbose/verbose.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>

namespace loger {
static constexpr std::string_view kProgram = "tocsec";

static int nr_errs = 0;

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::string detail = s2.has_value() ? fmt::format(" {}", s2.value()) : "";
  std::cerr << fmt::format("{0}: Error: {1}{2}", kProgram, s1, detail);
  std::cerr << std::endl;
  nr_errs++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  non_fatal(s1, s2);
  std::exit(1);
}

void trace(const std::string_view &message) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrintVerbose()) {
    return;
  }
  std::cerr << fmt::format("{}: {}", kProgram, message) << std::endl;
}

int ErrorCount() { return nr_errs; }

} // namespace loger
