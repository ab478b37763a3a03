#include "lexer.hpp"

#include "../errors/errors.hpp"
#include "helpers.hpp"
#include "names.hpp"
#include <cstdio>
#include <utility>

namespace rollkit::lexer {
Lexer::Lexer(std::string_view source) : stream_(source), last_token_() {}

void Lexer::SetLastToken(TokenType last_token) { last_token_ = last_token; }
std::optional<TokenType> Lexer::GetLastToken() { return last_token_; }

Token Lexer::Emit(TokenType type, std::string text, std::size_t position) {
  last_token_ = type;
  return Token{type, std::move(text), position};
}

Token Lexer::lex() {
  int curr;
  do {
    curr = stream_.GetChar();
  } while (curr != EOF && helpers::IsWhitespace(curr));

  if (curr == EOF) {
    stream_.Ungetch();
    return Emit(TokenType::kEnd, "", stream_.GetOffset());
  }

  std::size_t position = stream_.GetOffset() - 1;

  if (helpers::isdigit_(curr)) {
    return Emit(TokenType::kInteger, stream_.GetWord(curr, helpers::isdigit_),
                position);
  }

  if (helpers::isalpha_(curr)) {
    if (last_token_.has_value() && helpers::IsFollowsToken(*last_token_)) {
      stream_.Ungetch();
      auto opt_name = helpers::ParseOperatorName(stream_.Rest());
      if (!opt_name.has_value()) {
        throw errors::LexError(static_cast<char>(curr), position);
      }
      std::string text(stream_.Rest().substr(0, opt_name->length));
      stream_.Skip(opt_name->length);
      return Emit(opt_name->token, std::move(text), position);
    }
    return Emit(TokenType::kIdentifier,
                stream_.GetWord(curr, helpers::isalnum_), position);
  }

  stream_.Ungetch();
  auto opt_symbol = helpers::ParseSymbolToken(stream_.Rest());
  if (!opt_symbol.has_value()) {
    throw errors::LexError(static_cast<char>(curr), position);
  }
  std::string text(stream_.Rest().substr(0, opt_symbol->length));
  stream_.Skip(opt_symbol->length);
  return Emit(opt_symbol->token, std::move(text), position);
}

std::vector<Token> Lexer::Tokenize() {
  std::vector<Token> tokens;
  do {
    tokens.push_back(lex());
  } while (tokens.back().type != TokenType::kEnd);
  return tokens;
}

} // namespace rollkit::lexer
