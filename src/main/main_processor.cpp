#include "main_processor.hpp"

#include "../classifier/chunk_resolver.hpp"
#include "../fatal/fatal.hpp"
#include "../models/section_type.hpp"
#include "../utils/verbose/verbose.hpp"
#include "arguments_parser.hpp"
#include "help.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

int MainProcessor::main(int argc, char *argv[]) {
  ArgumentsParser parser;
  try {
    launch_settings_ = parser.Parse(argc, argv);
  } catch (const std::runtime_error &e) {
    loger::non_fatal(e.what());
    PrintHelp();
    return 1;
  }
  if (HandleLaunchSettings()) {
    return 0;
  }

  auto classification = Run(ReadToc());
  Print(classification);
  return loger::ErrorCount() == 0 ? 0 : 1;
}

bool MainProcessor::HandleLaunchSettings() {
  if (launch_settings_.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }
  if (launch_settings_.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  if (launch_settings_.need_print_label_map &&
      launch_settings_.need_print_title_map) {
    std::cerr << "tocsec: warning -t option ignored with -l" << std::endl;
    launch_settings_.need_print_title_map = false;
  }
  return false;
}

std::string MainProcessor::ReadFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    loger::fatal("cannot open", path);
  }
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

std::string MainProcessor::ReadToc() const {
  if (launch_settings_.toc_file.has_value()) {
    loger::trace(fmt::format("reading {}", launch_settings_.toc_file.value()));
    return ReadFile(launch_settings_.toc_file.value());
  }
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

classifier::Classification
MainProcessor::Run(const std::string &toc_text) const {
  models::DocumentContext context;
  context.total_pages = launch_settings_.total_pages;
  classifier::TocClassifier toc_classifier(context);

  if (!launch_settings_.classified_file.has_value()) {
    return toc_classifier.Classify(toc_text);
  }

  const auto &classified_file = launch_settings_.classified_file.value();
  auto restored =
      toc_classifier.Restore(toc_text, ReadFile(classified_file));
  if (!restored.has_value()) {
    loger::fatal("classified TOC does not match the TOC:", classified_file);
  }
  if (restored->needs_resave) {
    loger::trace(fmt::format("{} is stale and should be rewritten",
                             classified_file));
  }
  return restored->classification;
}

void MainProcessor::Print(
    const classifier::Classification &classification) const {
  if (launch_settings_.chunk_page.has_value()) {
    classifier::ChunkSectionResolver resolver(classification);
    auto label = resolver.LabelFor(launch_settings_.chunk_page, {});
    std::cout << models::ToString(label) << std::endl;
    return;
  }

  if (launch_settings_.need_print_label_map) {
    for (const auto &entry : classification.entries) {
      std::cout << fmt::format(
                       "{}\t{}", entry.index,
                       models::ToString(models::LabelAt(classification.labels,
                                                        entry.index)))
                << '\n';
    }
    std::cout.flush();
    return;
  }

  if (launch_settings_.need_print_title_map) {
    for (const auto &[title, label] :
         classifier::TocClassifier::TitleLabels(classification)) {
      std::cout << fmt::format("{}\t{}", title, models::ToString(label))
                << '\n';
    }
    std::cout.flush();
    return;
  }

  auto rendered = classifier::TocClassifier::Render(classification);
  if (!rendered.empty()) {
    std::cout << rendered << std::endl;
  }
}
