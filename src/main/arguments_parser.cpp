#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

// Takes the value of the option in argv[1], attached or from argv[2].
static std::string OptionValue(int &argc, char **&argv) {
  if (argv[1][2] != '\0') {
    return std::string(&argv[1][2]);
  }
  if (argc < 3) {
    throw std::runtime_error(
        std::string("missing parameter on -") + argv[1][1]);
  }
  argc--;
  argv++;
  return std::string(argv[1]);
}

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  while (argc > 1 && argv[1][0] == '-' && argv[1][1] != '\0') {
    switch (argv[1][1]) {
    case '-': {
      if (std::strcmp(argv[1], "--version") == 0) {
        result.need_to_print_version_and_stop = true;
      } else {
        result.need_to_print_help_and_stop = true;
      }
      break;
    }
    case 'c': {
      result.SetChunkPage(OptionValue(argc, argv));
      break;
    }
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'l': {
      result.need_print_label_map = true;
      break;
    }
    case 'p': {
      result.SetTotalPages(OptionValue(argc, argv));
      break;
    }
    case 'r': {
      result.classified_file = OptionValue(argc, argv);
      break;
    }
    case 't': {
      result.need_print_title_map = true;
      break;
    }
    case 'v': {
      verbose_flags.SetNeedToPrintVerbose();
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    case 'w': {
      verbose_flags.SetNeedToPrintVeryVerbose();
      break;
    }
    default: {
      result.need_to_print_help_and_stop = true;
      break;
    }
    }
    argc--;
    argv++;
  }
  if (argc > 1) {
    result.toc_file = std::string(argv[1]);
  }
  return result;
}
