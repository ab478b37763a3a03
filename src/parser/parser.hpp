#pragma once

#include "../lexer/token.hpp"
#include "../models/node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rollkit::parser {

/**
 * @class Parser
 * @brief Builds an expression tree from a token sequence by precedence
 * climbing.
 *
 * Precedence, tightest first: `d` (right-associative), `kh kl dh dl`, `*`,
 * `+ -`, then the comparisons. All but `d` group to the left.
 */
class Parser {
public:
  /**
   * @brief Constructs a parser over a token sequence ending in kEnd.
   * @param tokens The tokens to parse.
   */
  explicit Parser(std::vector<lexer::Token> tokens);

  /**
   * @brief Parses the whole token sequence as one expression.
   * @return The root of the expression tree.
   * @throws errors::ParseError on any malformed construct or trailing token.
   */
  models::NodePtr Parse();

private:
  const lexer::Token &Peek(std::size_t ahead = 0) const;
  const lexer::Token &Advance();
  bool Match(lexer::TokenType type);
  const lexer::Token &Expect(lexer::TokenType type, const std::string &expected);
  [[noreturn]] void Fail(const lexer::Token &found,
                         const std::string &expected) const;
  void Descend(const lexer::Token &at);

  models::NodePtr ParseExpression(int min_precedence);
  models::NodePtr ParseAtom();
  models::NodePtr ParsePrimary();
  models::NodePtr ParseInteger(const lexer::Token &digits, bool negative,
                               std::size_t position);
  models::NodePtr ParseBraces();
  models::NodePtr ParseRange();
  models::NodePtr ParseCall();
  std::vector<models::NodePtr> ParseSeparated(lexer::TokenType close,
                                              const std::string &closing);

  std::vector<lexer::Token> tokens_; /**< Tokens ending in kEnd. */
  std::size_t current_;              /**< Index of the next token. */
  std::size_t depth_;                /**< Depth of the tree being built. */
};

/// Deepest tree the parser builds; evaluation recurses once per level.
constexpr std::size_t kMaxDepth = 1000;

/**
 * @brief Maps a token to the binary operator it spells, if any.
 */
std::optional<models::BinaryOperator> ToBinaryOperator(lexer::TokenType type);

/**
 * @brief Lexes and parses a complete expression.
 * @param text The expression text.
 * @return The root of the expression tree.
 * @throws errors::LexError, errors::ParseError
 */
models::NodePtr Parse(std::string_view text);

} // namespace rollkit::parser
