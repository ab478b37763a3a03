#include "names.hpp"

#include "helpers.hpp"
#include <string_view>
#include <unordered_map>

namespace rollkit::lexer::helpers {

const std::unordered_map<std::string_view, TokenType> kOperatorNames{
    {"d", TokenType::kDice},      {"kh", TokenType::kKeepHigh},
    {"kl", TokenType::kKeepLow},  {"dh", TokenType::kDropHigh},
    {"dl", TokenType::kDropLow},
};

const std::unordered_map<std::string_view, TokenType> kSymbols{
    {"*", TokenType::kStar},          {"+", TokenType::kPlus},
    {"-", TokenType::kMinus},         {"==", TokenType::kEqual},
    {"!=", TokenType::kNotEqual},     {"<", TokenType::kLess},
    {"<=", TokenType::kLessEqual},    {">", TokenType::kGreater},
    {">=", TokenType::kGreaterEqual}, {"(", TokenType::kLeftParen},
    {")", TokenType::kRightParen},    {"{", TokenType::kLeftBrace},
    {"}", TokenType::kRightBrace},    {"[", TokenType::kLeftBracket},
    {"]", TokenType::kRightBracket},  {",", TokenType::kComma},
};

static std::optional<Name>
LongestMatch(const std::unordered_map<std::string_view, TokenType> &table,
             std::string_view value) {
  for (std::size_t length = 2; length > 0; length--) {
    if (value.size() < length) {
      continue;
    }
    auto it = table.find(value.substr(0, length));
    if (it != table.end()) {
      return Name{it->second, length};
    }
  }
  return std::nullopt;
}

std::optional<Name> ParseOperatorName(std::string_view value) {
  auto name = LongestMatch(kOperatorNames, value);
  // "dl"/"dh" running into more letters is a roll over a call: 2dlen(...).
  if (name.has_value() && name->length == 2 && value.size() > 2 &&
      isalpha_(static_cast<unsigned char>(value[2]))) {
    auto shorter = kOperatorNames.find(value.substr(0, 1));
    if (shorter != kOperatorNames.end()) {
      return Name{shorter->second, 1};
    }
  }
  return name;
}

std::optional<Name> ParseSymbolToken(std::string_view value) {
  return LongestMatch(kSymbols, value);
}

} // namespace rollkit::lexer::helpers
