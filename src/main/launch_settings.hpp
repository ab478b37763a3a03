#pragma once

#include "../run/eval.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rollkit::main {

struct LaunchSettings {
  bool need_to_print_help_and_stop = false;
  bool need_to_print_version_and_stop = false;
  bool need_to_print_seed = false;

  std::optional<long> fixed_seed; // -n<seed>, otherwise drawn from the clock

  run::EvalLimits limits; // -l<n> sets limits.max_list_length

  std::vector<std::string> expressions; // read from stdin when empty

  /**
   * @brief Applies a numeric option value.
   * @param option The option letter.
   * @param value The text after the letter.
   * @throws std::runtime_error if the value is missing or not a number in
   * range for the option.
   */
  void SetNumericOption(char option, const std::string &value);
};

} // namespace rollkit::main
