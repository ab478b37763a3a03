#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <cctype>
#include <fmt/core.h>
#include <stdexcept>
#include <string>

namespace rollkit::main {

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();

  while (argc > 1 && argv[1][0] == '-' &&
         !isdigit(static_cast<unsigned char>(argv[1][1]))) {
    if (argv[1][1] == '-' && argv[1][2] == '\0') {
      argc--;
      argv++;
      break;
    }
    switch (argv[1][1]) {
    case 'e': {
      verbose_flags.SetNeedToPrintExplanation();
      break;
    }
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'l':
    case 'n': {
      result.SetNumericOption(argv[1][1], std::string(&argv[1][2]));
      break;
    }
    case 'S': {
      result.need_to_print_seed = true;
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
    default:
      throw std::runtime_error(
          fmt::format("unknown option '{}'", argv[1]));
    }
    argc--;
    argv++;
  }

  for (int i = 1; i < argc; i++) {
    result.expressions.push_back(argv[i]);
  }
  return result;
}

} // namespace rollkit::main
