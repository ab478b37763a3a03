#include "parser.hpp"

#include "../errors/errors.hpp"
#include "../lexer/lexer.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace rollkit::parser {

using lexer::Token;
using lexer::TokenType;
using models::Node;
using models::NodePtr;

std::optional<models::BinaryOperator> ToBinaryOperator(TokenType type) {
  switch (type) {
  case TokenType::kDice:
    return models::BinaryOperator::kDice;
  case TokenType::kKeepHigh:
    return models::BinaryOperator::kKeepHigh;
  case TokenType::kKeepLow:
    return models::BinaryOperator::kKeepLow;
  case TokenType::kDropHigh:
    return models::BinaryOperator::kDropHigh;
  case TokenType::kDropLow:
    return models::BinaryOperator::kDropLow;
  case TokenType::kStar:
    return models::BinaryOperator::kMul;
  case TokenType::kPlus:
    return models::BinaryOperator::kAdd;
  case TokenType::kMinus:
    return models::BinaryOperator::kSub;
  case TokenType::kEqual:
    return models::BinaryOperator::kEq;
  case TokenType::kNotEqual:
    return models::BinaryOperator::kNe;
  case TokenType::kLess:
    return models::BinaryOperator::kLt;
  case TokenType::kLessEqual:
    return models::BinaryOperator::kLe;
  case TokenType::kGreater:
    return models::BinaryOperator::kGt;
  case TokenType::kGreaterEqual:
    return models::BinaryOperator::kGe;
  default:
    break;
  }
  return std::nullopt;
}

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens)), current_(0), depth_(0) {
  if (tokens_.empty() || tokens_.back().type != TokenType::kEnd) {
    std::size_t end = tokens_.empty() ? 0
                                      : tokens_.back().position +
                                            tokens_.back().text.size();
    tokens_.push_back(Token{TokenType::kEnd, "", end});
  }
}

const Token &Parser::Peek(std::size_t ahead) const {
  std::size_t index = current_ + ahead;
  if (index >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[index];
}

const Token &Parser::Advance() {
  const Token &token = Peek();
  if (token.type != TokenType::kEnd) {
    current_++;
  }
  return token;
}

bool Parser::Match(TokenType type) {
  if (Peek().type != type) {
    return false;
  }
  Advance();
  return true;
}

const Token &Parser::Expect(TokenType type, const std::string &expected) {
  if (Peek().type != type) {
    Fail(Peek(), expected);
  }
  return Advance();
}

void Parser::Fail(const Token &found, const std::string &expected) const {
  throw errors::ParseError(found.position, expected, lexer::Describe(found));
}

void Parser::Descend(const Token &at) {
  if (++depth_ > kMaxDepth) {
    throw errors::ParseError(
        at.position,
        fmt::format("expression nested at most {} levels", kMaxDepth),
        lexer::Describe(at));
  }
}

NodePtr Parser::Parse() {
  auto root = ParseExpression(0);
  if (Peek().type != TokenType::kEnd) {
    Fail(Peek(), "operator or end of input");
  }
  return root;
}

NodePtr Parser::ParseExpression(int min_precedence) {
  std::size_t saved_depth = depth_;
  auto left = ParseAtom();

  for (;;) {
    auto op = ToBinaryOperator(Peek().type);
    if (!op.has_value() || models::Precedence(*op) < min_precedence) {
      break;
    }
    // Every operator wraps the tree built so far in one more level.
    Descend(Peek());
    std::size_t position = Advance().position;
    int next_precedence = models::IsRightAssociative(*op)
                              ? models::Precedence(*op)
                              : models::Precedence(*op) + 1;
    auto right = ParseExpression(next_precedence);
    left = Node::MakeBinary(*op, std::move(left), std::move(right), position);
  }
  depth_ = saved_depth;
  return left;
}

NodePtr Parser::ParseAtom() {
  const Token &token = Peek();
  std::size_t saved_depth = depth_;
  switch (token.type) {
  case TokenType::kLeftParen:
  case TokenType::kLeftBrace:
  case TokenType::kLeftBracket:
  case TokenType::kIdentifier:
    Descend(token);
    break;
  default:
    break;
  }
  auto node = ParsePrimary();
  depth_ = saved_depth;
  return node;
}

NodePtr Parser::ParsePrimary() {
  const Token &token = Peek();
  switch (token.type) {
  case TokenType::kInteger: {
    Advance();
    return ParseInteger(token, false, token.position);
  }
  case TokenType::kMinus: {
    const Token &digits = Peek(1);
    if (digits.type != TokenType::kInteger ||
        digits.position != token.position + 1) {
      Fail(token, "expression");
    }
    Advance();
    Advance();
    return ParseInteger(digits, true, token.position);
  }
  case TokenType::kLeftBrace:
    return ParseBraces();
  case TokenType::kLeftBracket:
    return ParseRange();
  case TokenType::kIdentifier:
    return ParseCall();
  case TokenType::kLeftParen: {
    Advance();
    auto inner = ParseExpression(0);
    Expect(TokenType::kRightParen, "')'");
    return inner;
  }
  default:
    break;
  }
  Fail(token, "expression");
}

NodePtr Parser::ParseInteger(const Token &digits, bool negative,
                             std::size_t position) {
  std::string text = negative ? fmt::format("-{}", digits.text) : digits.text;
  long long value;
  try {
    std::size_t pos;
    value = std::stoll(text, &pos, 10);
    if (pos != text.length()) {
      throw std::invalid_argument(text);
    }
  } catch (const std::logic_error &) {
    throw errors::ParseError(position, "integer literal in 64-bit range",
                             fmt::format("'{}'", text));
  }
  return Node::MakeInteger(static_cast<std::int64_t>(value), position);
}

std::vector<NodePtr> Parser::ParseSeparated(TokenType close,
                                            const std::string &closing) {
  std::vector<NodePtr> items;
  while (Peek().type != close) {
    items.push_back(ParseExpression(0));
    if (!Match(TokenType::kComma)) {
      break;
    }
  }
  Expect(close, fmt::format("',' or {}", closing));
  return items;
}

NodePtr Parser::ParseBraces() {
  std::size_t position = Advance().position;

  if (Match(TokenType::kRightBrace)) {
    return Node::MakeList({}, position);
  }

  auto first = ParseExpression(0);
  if (Match(TokenType::kRightBrace)) {
    return Node::MakeStrong(std::move(first), position);
  }

  Expect(TokenType::kComma, "',' or '}'");
  std::vector<NodePtr> elements;
  elements.push_back(std::move(first));
  for (auto &element : ParseSeparated(TokenType::kRightBrace, "'}'")) {
    elements.push_back(std::move(element));
  }
  return Node::MakeList(std::move(elements), position);
}

static bool IsLiteralZero(const Node &node) {
  return node.kind == models::NodeKind::kIntegerLiteral && node.value == 0;
}

NodePtr Parser::ParseRange() {
  std::size_t position = Advance().position;

  auto start = ParseExpression(0);
  Expect(TokenType::kComma, "','");
  auto end = ParseExpression(0);

  NodePtr step;
  if (Match(TokenType::kComma)) {
    const Token &step_token = Peek();
    step = ParseExpression(0);
    if (IsLiteralZero(*step)) {
      throw errors::ParseError(step_token.position, "non-zero range step",
                               "0");
    }
  }
  Expect(TokenType::kRightBracket, step ? "']'" : "',' or ']'");
  return Node::MakeRange(std::move(start), std::move(end), std::move(step),
                         position);
}

NodePtr Parser::ParseCall() {
  const Token &name = Advance();
  Expect(TokenType::kLeftParen, fmt::format("'(' after '{}'", name.text));
  auto args = ParseSeparated(TokenType::kRightParen, "')'");
  return Node::MakeCall(name.text, std::move(args), name.position);
}

NodePtr Parse(std::string_view text) {
  lexer::Lexer lexer(text);
  Parser parser(lexer.Tokenize());
  return parser.Parse();
}

} // namespace rollkit::parser
