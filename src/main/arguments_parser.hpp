#pragma once
#include "launch_settings.hpp"

namespace rollkit::main {
/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating launch settings.
 */
class ArgumentsParser {
public:
    /**
     * @brief Parses the command-line arguments and generates launch settings.
     *
     * Options come first; the first argument that is not an option, or
     * everything after "--", is taken as expressions. An argument such as
     * "-2d6" is an expression, not an option.
     *
     * @param argc The number of command-line arguments.
     * @param argv The array of command-line arguments.
     * @return The generated launch settings based on the parsed command-line arguments.
     * @throws std::runtime_error on an unknown option or a bad option value.
     */
    LaunchSettings Parse(int argc, char **argv);
};
} // namespace rollkit::main
