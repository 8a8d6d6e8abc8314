#include "launch_settings.hpp"

#include "../utils/verbose/verbose.hpp"
#include <charconv>
#include <fmt/core.h>
#include <iostream>

static int ParsePageNumber(const std::string &value, char option) {
  int result = 0;
  auto [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), result);
  if (value.empty() || error != std::errc() ||
      end != value.data() + value.size() || result < 0) {
    throw std::runtime_error(
        fmt::format("bad or missing parameter on -{}: '{}'", option, value));
  }
  return result;
}

void LaunchSettings::SetTotalPages(const std::string &value) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  total_pages = ParsePageNumber(value, 'p');
  if (verbose_flags.NeedToPrintVerbose() && total_pages.value() == 0) {
    std::cerr << "tocsec: page count 0 disables page-dependent rules"
              << std::endl;
  }
}

void LaunchSettings::SetChunkPage(const std::string &value) {
  chunk_page = ParsePageNumber(value, 'c');
}
