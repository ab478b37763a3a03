#include "helpers.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace rollkit::lexer::helpers {

constexpr std::array<TokenType, 4> kSpecials = {
    TokenType::kInteger, TokenType::kRightParen, TokenType::kRightBrace,
    TokenType::kRightBracket};

int isdigit_(int curr) { return isdigit(curr); }
int isalpha_(int curr) { return (isalpha(curr) || curr == '_'); }
int isalnum_(int curr) { return (isalnum(curr) || curr == '_'); }

bool IsFollowsToken(TokenType curr_token) {
  auto it = std::find(kSpecials.begin(), kSpecials.end(), curr_token);
  return it != kSpecials.end();
}

bool IsWhitespace(int curr) {
  return curr == ' ' || curr == '\t' || curr == '\f' || curr == '\n' ||
         curr == '\r' || curr == '\v';
}

} // namespace rollkit::lexer::helpers
