#include "main/main_processor.hpp"

int main(int argc, char *argv[]) {
  rollkit::main::MainProcessor main;
  return main.main(argc, argv);
}
