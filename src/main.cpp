#include "main/main_processor.hpp"

int main(int argc, char *argv[]) {
  MainProcessor processor;
  return processor.main(argc, argv);
}
