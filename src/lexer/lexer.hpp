#pragma once

#include "source_stream.hpp"
#include "token.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace rollkit::lexer {
/**
 * @brief Class responsible for lexical analysis of dice expressions.
 *
 * Whitespace is skipped. Letters are read as an operator keyword when the
 * previous token ended an operand (`4d6kh3`), and as an identifier otherwise
 * (`max(...)`). A `-` is always emitted as its own token; the parser decides
 * whether it is a sign or a subtraction.
 */
class Lexer {
public:
  /**
   * @brief Constructs a lexer over the given source text.
   * @param source The expression text.
   */
  explicit Lexer(std::string_view source);
  /**
   * @brief Sets the last token type.
   * @param last_token The type of the last token.
   */
  void SetLastToken(TokenType last_token);
  /**
   * @brief Gets the last token type.
   * @return The type of the last token, if any token was produced.
   */
  std::optional<TokenType> GetLastToken();
  /**
   * @brief Performs lexical analysis of the next token.
   * @return The next token; kEnd once the input is exhausted.
   * @throws errors::LexError on a character no token can start with.
   */
  Token lex();
  /**
   * @brief Lexes the whole input.
   * @return Every token in order, terminated by a kEnd token.
   * @throws errors::LexError on a character no token can start with.
   */
  std::vector<Token> Tokenize();

private:
  /**
   * @brief Records a token as the last one and returns it.
   */
  Token Emit(TokenType type, std::string text, std::size_t position);

  SourceStream stream_; /**< The character stream being lexed. */
  std::optional<TokenType> last_token_; /**< The type of the last token. */
};
} // namespace rollkit::lexer
