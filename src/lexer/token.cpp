#include "token.hpp"

#include <fmt/core.h>

namespace rollkit::lexer {

std::string Describe(const Token &token) {
  switch (token.type) {
  case TokenType::kEnd:
    return "end of input";
  case TokenType::kInteger:
    return fmt::format("integer '{}'", token.text);
  case TokenType::kIdentifier:
    return fmt::format("identifier '{}'", token.text);
  default:
    break;
  }
  return fmt::format("'{}'", token.text);
}

} // namespace rollkit::lexer
