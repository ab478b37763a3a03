#include "main_processor.hpp"

#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"
#include "../rollkit.hpp"
#include "../utils/format/explain_viewer.hpp"
#include "../utils/format/report.hpp"
#include "../utils/seed/seed.hpp"
#include "../utils/verbose/verbose.hpp"
#include "arguments_parser.hpp"
#include <fmt/core.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace rollkit::main {

int MainProcessor::main(int argc, char *argv[]) {
  ArgumentsParser parser;
  LaunchSettings settings;
  try {
    settings = parser.Parse(argc, argv);
  } catch (const std::runtime_error &error) {
    loger::fatal(error.what(), "(try -h)");
    return 2;
  }
  return Run(settings, std::cin);
}

int MainProcessor::Run(const LaunchSettings &settings, std::istream &in) {
  if (HandleLaunchSettings(settings)) {
    return 0;
  }

  loger::ResetErrorCount();
  run::SeededSource random(static_cast<std::uint64_t>(InitSeed(settings)));

  std::size_t seq = 1;
  if (!settings.expressions.empty()) {
    for (const auto &expression : settings.expressions) {
      ProcessExpression(seq++, expression, random, settings);
    }
  } else {
    std::string line;
    while (std::getline(in, line)) {
      StringTrim(line);
      if (line.empty()) {
        continue;
      }
      ProcessExpression(seq++, line, random, settings);
    }
  }
  return loger::GetErrorCount() > 0 ? 1 : 0;
}

long MainProcessor::InitSeed(const LaunchSettings &settings) {
  auto &seed = utils::seed::Seed::getInstance();
  if (settings.fixed_seed.has_value()) {
    seed.SetSeed(settings.fixed_seed.value());
  } else {
    seed.GenerateSeed();
  }
  seed.SetNeedToPrintSeed(settings.need_to_print_seed);

  long run_seed = seed.GetSeed();
  if (seed.NeedToPrintSeed()) {
    std::cout << fmt::format("rollkit: seed {}", run_seed) << std::endl;
  }
  return run_seed;
}

bool MainProcessor::HandleLaunchSettings(const LaunchSettings &settings) {
  if (settings.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }
  if (settings.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  return false;
}

void MainProcessor::ProcessExpression(std::size_t seq, const std::string &text,
                                      run::RandomSource &random,
                                      const LaunchSettings &settings) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();

  models::NodePtr tree;
  try {
    tree = Parse(text);
  } catch (const errors::Error &error) {
    loger::non_fatal(fmt::format("[{}] {}", seq, loger::explainToString(error)),
                     fmt::format("in '{}'", text));
    return;
  }

  if (verbose_flags.NeedToPrintVerbose()) {
    std::cout << fmt::format("[{}] parsed: {}", seq, format::FormatInline(*tree))
              << std::endl;
  }

  try {
    auto value = EvalWith(*tree, random, settings.limits);
    std::cout << fmt::format("[{}] {}", seq, format::FormatResult(value))
              << std::endl;
  } catch (const errors::Error &error) {
    loger::non_fatal(fmt::format("[{}] {}", seq, loger::explainToString(error)),
                     fmt::format("in '{}'", text));
  }

  if (verbose_flags.NeedToPrintExplanation()) {
    format::ExplainViewer viewer(2);
    std::cout << "Explanation:" << std::endl;
    std::cout << fmt::format("  Parsed: {}", format::FormatInline(*tree))
              << std::endl;
    std::cout << "  Expression Structure:" << std::endl;
    std::cout << viewer.view(*tree) << std::endl;
  }
}

void MainProcessor::PrintHelp() {
  std::cout << "use: rollkit [-option] ... [expression] ...\n"
               "\t-e      explain the structure of each expression\n"
               "\t-h      print this help message\n"
               "\t-lN     limit lists to N elements (default 1000000)\n"
               "\t-nN     seed the dice with N\n"
               "\t-S      print the seed in use\n"
               "\t-v      verbose, print the parsed form of each expression\n"
               "\t-V      print version number and exit\n"
               "\t--      treat every following argument as an expression\n"
               "with no expression arguments, one expression is read per line "
               "of standard input\n"
               "examples: 3d6   4d6kh3   2d6 + 5   2d{1,2,3,5,8}   [1, 10, 2]"
            << std::endl;
}

void MainProcessor::PrintVersion() {
  std::cout << fmt::format("rollkit version {}", ROLLKIT_VERSION) << std::endl;
}

void MainProcessor::StringTrim(std::string &t) {
  const char *whitespace = " \t\n\r\f\v";
  auto first = t.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    t.clear();
    return;
  }
  auto last = t.find_last_not_of(whitespace);
  t = t.substr(first, last - first + 1);
}

} // namespace rollkit::main
