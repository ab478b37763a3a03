#include "node.hpp"

#include <utility>

namespace rollkit::models {

int Precedence(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::kDice:
    return 150;
  case BinaryOperator::kKeepHigh:
  case BinaryOperator::kKeepLow:
  case BinaryOperator::kDropHigh:
  case BinaryOperator::kDropLow:
    return 130;
  case BinaryOperator::kMul:
    return 90;
  case BinaryOperator::kAdd:
  case BinaryOperator::kSub:
    return 70;
  case BinaryOperator::kEq:
  case BinaryOperator::kNe:
  case BinaryOperator::kLt:
  case BinaryOperator::kLe:
  case BinaryOperator::kGt:
  case BinaryOperator::kGe:
    return 50;
  }
  return 0;
}

bool IsRightAssociative(BinaryOperator op) { return op == BinaryOperator::kDice; }

std::string ToSymbol(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::kDice:
    return "d";
  case BinaryOperator::kKeepHigh:
    return "kh";
  case BinaryOperator::kKeepLow:
    return "kl";
  case BinaryOperator::kDropHigh:
    return "dh";
  case BinaryOperator::kDropLow:
    return "dl";
  case BinaryOperator::kMul:
    return "*";
  case BinaryOperator::kAdd:
    return "+";
  case BinaryOperator::kSub:
    return "-";
  case BinaryOperator::kEq:
    return "==";
  case BinaryOperator::kNe:
    return "!=";
  case BinaryOperator::kLt:
    return "<";
  case BinaryOperator::kLe:
    return "<=";
  case BinaryOperator::kGt:
    return ">";
  case BinaryOperator::kGe:
    return ">=";
  }
  return "?";
}

std::string Describe(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::kDice:
    return "Dice Roll";
  case BinaryOperator::kKeepHigh:
    return "Keep Highest";
  case BinaryOperator::kKeepLow:
    return "Keep Lowest";
  case BinaryOperator::kDropHigh:
    return "Drop Highest";
  case BinaryOperator::kDropLow:
    return "Drop Lowest";
  case BinaryOperator::kMul:
    return "Multiplication";
  case BinaryOperator::kAdd:
    return "Addition";
  case BinaryOperator::kSub:
    return "Subtraction";
  case BinaryOperator::kEq:
    return "Equal";
  case BinaryOperator::kNe:
    return "Not Equal";
  case BinaryOperator::kLt:
    return "Less Than";
  case BinaryOperator::kLe:
    return "Less or Equal";
  case BinaryOperator::kGt:
    return "Greater Than";
  case BinaryOperator::kGe:
    return "Greater or Equal";
  }
  return "Unknown";
}

static NodePtr nn(NodeKind kind, std::size_t position) {
  auto n = std::make_unique<Node>();
  n->kind = kind;
  n->op = BinaryOperator::kAdd;
  n->position = position;
  return n;
}

NodePtr Node::MakeInteger(std::int64_t value, std::size_t position) {
  auto n = nn(NodeKind::kIntegerLiteral, position);
  n->value = value;
  return n;
}

NodePtr Node::MakeList(std::vector<NodePtr> elements, std::size_t position) {
  auto n = nn(NodeKind::kExplicitListLiteral, position);
  n->children = std::move(elements);
  return n;
}

NodePtr Node::MakeRange(NodePtr start, NodePtr end, NodePtr step,
                        std::size_t position) {
  auto n = nn(NodeKind::kRangeListLiteral, position);
  n->children.push_back(std::move(start));
  n->children.push_back(std::move(end));
  if (step) {
    n->children.push_back(std::move(step));
  }
  return n;
}

NodePtr Node::MakeStrong(NodePtr inner, std::size_t position) {
  auto n = nn(NodeKind::kStrongWrap, position);
  n->children.push_back(std::move(inner));
  return n;
}

NodePtr Node::MakeBinary(BinaryOperator op, NodePtr left, NodePtr right,
                         std::size_t position) {
  auto n = nn(NodeKind::kBinaryOp, position);
  n->op = op;
  n->children.push_back(std::move(left));
  n->children.push_back(std::move(right));
  return n;
}

NodePtr Node::MakeCall(const std::string &name, std::vector<NodePtr> args,
                       std::size_t position) {
  auto n = nn(NodeKind::kCall, position);
  n->name = name;
  n->children = std::move(args);
  return n;
}

} // namespace rollkit::models
