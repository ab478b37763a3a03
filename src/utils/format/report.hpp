#pragma once

#include "../../models/value.hpp"

#include <string>

namespace rollkit::format {

/**
 * @brief Renders an evaluation result for display.
 *
 * An Integer is shown as itself. A List is shown as its sum followed by its
 * length and elements: `11 (from list with 3 elements: {2, 4, 5})`.
 *
 * @param value The result.
 * @return The display text.
 */
std::string FormatResult(const models::Value &value);

} // namespace rollkit::format
