#pragma once

#include <cstddef>
#include <string>

namespace rollkit::lexer {

/**
 * @brief Kinds of tokens produced by the lexer.
 */
enum class TokenType {
  kInteger,
  kIdentifier,
  kDice,
  kKeepHigh,
  kKeepLow,
  kDropHigh,
  kDropLow,
  kStar,
  kPlus,
  kMinus,
  kEqual,
  kNotEqual,
  kLess,
  kLessEqual,
  kGreater,
  kGreaterEqual,
  kLeftParen,
  kRightParen,
  kLeftBrace,
  kRightBrace,
  kLeftBracket,
  kRightBracket,
  kComma,
  kEnd
};

/**
 * @struct Token
 * Structure representing one lexical token.
 */
struct Token {
  TokenType type;       /**< Token kind. */
  std::string text;     /**< Source text of the token, empty for kEnd. */
  std::size_t position; /**< Byte offset of the first character. */
};

/**
 * @brief Describes a token for error messages, e.g. "integer '12'".
 * @param token The token to describe.
 * @return The description.
 */
std::string Describe(const Token &token);

} // namespace rollkit::lexer
