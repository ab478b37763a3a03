#include "launch_settings.hpp"

#include <fmt/core.h>
#include <stdexcept>

namespace rollkit::main {

static long ParseNumber(char option, const std::string &value) {
  try {
    std::size_t pos;
    long number = std::stol(value, &pos, 10);
    if (pos != value.length()) {
      throw std::invalid_argument(value);
    }
    return number;
  } catch (const std::logic_error &) {
    throw std::runtime_error(
        fmt::format("bad or missing parameter on -{}", option));
  }
}

void LaunchSettings::SetNumericOption(char option, const std::string &value) {
  long number = ParseNumber(option, value);
  switch (option) {
  case 'n':
    fixed_seed = number;
    break;
  case 'l':
    if (number < 0) {
      throw std::runtime_error(
          fmt::format("list limit must not be negative, got {}",
                      number));
    }
    limits.max_list_length = static_cast<std::size_t>(number);
    break;
  default:
    throw std::runtime_error(fmt::format("unknown option -{}", option));
  }
}

} // namespace rollkit::main
