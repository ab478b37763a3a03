#pragma once

#include "../run/random_source.hpp"
#include "launch_settings.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace rollkit::main {
/**
 * @brief Class representing the main processor of the command-line driver.
 *
 * Evaluates each expression given on the command line, or each non-blank
 * line of the input stream, and prints one result line per expression.
 */
class MainProcessor {
public:
  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Runs the driver with already parsed settings.
   * @param settings The launch settings.
   * @param in Stream to read expressions from when the settings carry none.
   * @return 0 if every expression evaluated, 1 otherwise.
   */
  int Run(const LaunchSettings &settings, std::istream &in);

private:
  /**
   * @brief Initializes the seed of the run.
   * @param settings The launch settings.
   * @return The seed every expression of the run draws from.
   */
  long InitSeed(const LaunchSettings &settings);

  /**
   * @brief Handles the launch settings that stop the program early.
   * @param settings The launch settings.
   * @return True if the program should stop, false otherwise.
   */
  bool HandleLaunchSettings(const LaunchSettings &settings);

  /**
   * @brief Parses, evaluates and prints one expression.
   * @param seq The sequence number shown in front of the result.
   * @param text The expression.
   * @param random The random source of the run.
   * @param settings The launch settings.
   */
  void ProcessExpression(std::size_t seq, const std::string &text,
                         run::RandomSource &random,
                         const LaunchSettings &settings);

  /**
   * @brief Prints the usage text.
   */
  static void PrintHelp();

  /**
   * @brief Prints the version line.
   */
  static void PrintVersion();

  /**
   * @brief Trims whitespace from the beginning and end of a string.
   * @param t The string to be trimmed.
   */
  static void StringTrim(std::string &t);
};
} // namespace rollkit::main
