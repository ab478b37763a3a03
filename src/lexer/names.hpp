#pragma once

#include "token.hpp"
#include <optional>
#include <string_view>

namespace rollkit::lexer::helpers {

/**
 * @brief Represents a symbol token matched at the start of some input.
 */
struct Name {
  TokenType token;    /**< The matched token kind. */
  std::size_t length; /**< Number of characters the symbol spans. */
};

/**
 * @brief Matches an operator keyword (`d`, `kh`, `kl`, `dh`, `dl`) at the
 * start of the given text, longest match first.
 *
 * A two-letter keyword followed by another letter gives way to `d`, so
 * `dlen` reads as `d` then the identifier `len`.
 *
 * @param value The text to match against.
 * @return The matched keyword if one starts the text, otherwise std::nullopt.
 */
std::optional<Name> ParseOperatorName(std::string_view value);

/**
 * @brief Matches a punctuation or symbolic operator (`+`, `<=`, `{`, ...) at
 * the start of the given text, longest match first.
 * @param value The text to match against.
 * @return The matched symbol if one starts the text, otherwise std::nullopt.
 */
std::optional<Name> ParseSymbolToken(std::string_view value);

} // namespace rollkit::lexer::helpers
