#include "help.hpp"

#include "../tocsec.hpp"
#include <fmt/core.h>
#include <iostream>

void PrintHelp() {
  std::cout << "use: tocsec [-option] ... [toc-file]\n"
               "\t-c<N>  print the section type of a chunk on page N\n"
               "\t-h     print this help\n"
               "\t-l     print entry index and label instead of TOC lines\n"
               "\t-p<N>  the document has N pages\n"
               "\t-r<F>  restore labels from classified TOC file F\n"
               "\t-t     print normalized title and label\n"
               "\t-v     verbose, trace classification decisions\n"
               "\t-V     print version number, exit\n"
               "\t-w     very verbose, print labels after every stage\n"
               "\tthe TOC is read from stdin when no toc-file is given\n";
}

void PrintVersion() {
  std::cout << fmt::format("{} {}", kTocsecName, kTocsecVersion) << std::endl;
}
