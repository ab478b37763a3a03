#include "eval.hpp"

#include "../errors/errors.hpp"
#include "../models/combine.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rollkit::run {

using errors::EvalError;
using errors::EvalErrorKind;
using models::BinaryOperator;
using models::ListKind;
using models::Node;
using models::NodeKind;
using models::Value;

std::int64_t ToInteger(const Value &value, const char *what) {
  if (value.IsStrong()) {
    throw EvalError(EvalErrorKind::kExpectedInteger,
                    fmt::format("{} must be an integer, got strong list {}",
                                what, models::ToString(value)));
  }
  return value.Sum();
}

std::uint64_t RangeLength(std::int64_t start, std::int64_t end,
                          std::int64_t step) {
  auto ustart = static_cast<std::uint64_t>(start);
  auto uend = static_cast<std::uint64_t>(end);
  std::uint64_t span = start <= end ? uend - ustart : ustart - uend;
  std::uint64_t magnitude = step < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(step)
                                     : static_cast<std::uint64_t>(step);
  std::uint64_t steps = span / magnitude;
  if (steps == std::numeric_limits<std::uint64_t>::max()) {
    return steps;
  }
  return steps + 1;
}

Evaluator::Evaluator(RandomSource &random, const functions::Registry &registry,
                     EvalLimits limits)
    : random_(random), registry_(registry), limits_(limits) {}

Value Evaluator::Eval(const Node &node) {
  switch (node.kind) {
  case NodeKind::kIntegerLiteral:
    return Value::Integer(node.value);
  case NodeKind::kExplicitListLiteral:
    return EvalExplicitList(node);
  case NodeKind::kRangeListLiteral:
    return EvalRange(node);
  case NodeKind::kStrongWrap:
    return EvalStrongWrap(node);
  case NodeKind::kBinaryOp:
    return EvalBinary(node);
  case NodeKind::kCall:
    return EvalCall(node);
  }
  throw std::logic_error("unknown node kind");
}

void Evaluator::CheckLength(std::uint64_t length, const char *what) const {
  if (length > limits_.max_list_length) {
    throw EvalError(EvalErrorKind::kListTooLarge,
                    fmt::format("{} would produce {} elements, limit is {}",
                                what, length, limits_.max_list_length));
  }
}

std::int64_t Evaluator::Draw(std::int64_t lo, std::int64_t hi) {
  auto drawn = random_.NextInRange(lo, hi);
  if (drawn < lo || drawn > hi) {
    throw EvalError(EvalErrorKind::kInvalidDraw,
                    fmt::format("random source returned {} outside [{}, {}]",
                                drawn, lo, hi));
  }
  return drawn;
}

Value Evaluator::EvalExplicitList(const Node &node) {
  std::vector<std::int64_t> elements;
  elements.reserve(node.children.size());
  for (const auto &child : node.children) {
    auto value = Eval(*child);
    if (value.IsStrong()) {
      throw EvalError(EvalErrorKind::kNonScalarListElement,
                      fmt::format("list element {} is a strong list",
                                  models::ToString(value)));
    }
    elements.push_back(value.Sum());
  }
  return Value::List(ListKind::kNormal, std::move(elements));
}

Value Evaluator::EvalRange(const Node &node) {
  auto start = ToInteger(Eval(*node.children[0]), "range start");
  auto end = ToInteger(Eval(*node.children[1]), "range end");
  std::int64_t step = 1;
  if (node.HasStep()) {
    step = ToInteger(Eval(*node.children[2]), "range step");
    if (step == 0) {
      throw EvalError(EvalErrorKind::kInvalidStep, "range step is zero");
    }
  }

  auto length = RangeLength(start, end, step);
  CheckLength(length, "range");

  std::uint64_t magnitude = step < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(step)
                                     : static_cast<std::uint64_t>(step);
  std::vector<std::int64_t> elements;
  elements.reserve(static_cast<std::size_t>(length));
  auto current = static_cast<std::uint64_t>(start);
  for (std::uint64_t i = 0; i < length; i++) {
    elements.push_back(static_cast<std::int64_t>(current));
    current = start <= end ? current + magnitude : current - magnitude;
  }
  return Value::List(ListKind::kNormal, std::move(elements));
}

Value Evaluator::EvalStrongWrap(const Node &node) {
  auto inner = Eval(node.Left());
  if (inner.IsInteger()) {
    throw EvalError(EvalErrorKind::kStrongWrapOfScalar,
                    fmt::format("cannot make a strong list of integer {}",
                                inner.GetInteger()));
  }
  return Value::List(ListKind::kStrong, inner.GetElements());
}

Value Evaluator::EvalBinary(const Node &node) {
  auto left = Eval(node.Left());
  auto right = Eval(node.Right());

  switch (node.op) {
  case BinaryOperator::kDice:
    return EvalDice(left, right);
  case BinaryOperator::kKeepHigh:
  case BinaryOperator::kKeepLow:
  case BinaryOperator::kDropHigh:
  case BinaryOperator::kDropLow:
    return EvalKeepDrop(node.op, left, right);
  default:
    break;
  }
  return models::Combine(node.op, left, right);
}

Value Evaluator::EvalDice(const Value &count, const Value &faces) {
  auto n = ToInteger(count, "dice count");
  if (n < 0) {
    throw EvalError(EvalErrorKind::kNegativeDiceCount,
                    fmt::format("cannot roll {} dice", n));
  }
  if (faces.IsInteger() && faces.GetInteger() < 1) {
    throw EvalError(EvalErrorKind::kInvalidSides,
                    fmt::format("a die needs at least 1 side, got {}",
                                faces.GetInteger()));
  }
  if (faces.IsList() && faces.GetElements().empty()) {
    throw EvalError(EvalErrorKind::kEmptyFaceList,
                    "cannot roll a die with no faces");
  }
  CheckLength(static_cast<std::uint64_t>(n), "dice roll");

  std::vector<std::int64_t> rolls;
  rolls.reserve(static_cast<std::size_t>(n));
  for (std::int64_t i = 0; i < n; i++) {
    if (faces.IsInteger()) {
      rolls.push_back(Draw(1, faces.GetInteger()));
    } else {
      const auto &elements = faces.GetElements();
      auto index = Draw(0, static_cast<std::int64_t>(elements.size()) - 1);
      rolls.push_back(elements[static_cast<std::size_t>(index)]);
    }
  }
  return Value::List(ListKind::kNormal, std::move(rolls));
}

Value Evaluator::EvalKeepDrop(BinaryOperator op, const Value &list,
                              const Value &count) {
  if (!list.IsList()) {
    throw EvalError(EvalErrorKind::kExpectedList,
                    fmt::format("'{}' needs a list on the left, got {}",
                                models::ToSymbol(op), models::ToString(list)));
  }
  auto k = ToInteger(count, "keep/drop count");
  const auto &elements = list.GetElements();
  if (k < 0 || static_cast<std::uint64_t>(k) > elements.size()) {
    throw EvalError(EvalErrorKind::kCountOutOfRange,
                    fmt::format("cannot {} {} of {} elements",
                                models::Describe(op), k, elements.size()));
  }

  bool highest =
      op == BinaryOperator::kKeepHigh || op == BinaryOperator::kDropHigh;
  bool keep = op == BinaryOperator::kKeepHigh || op == BinaryOperator::kKeepLow;

  std::vector<std::size_t> order(elements.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&elements, highest](std::size_t a, std::size_t b) {
                     return highest ? elements[a] > elements[b]
                                    : elements[a] < elements[b];
                   });

  std::vector<bool> selected(elements.size(), !keep);
  for (std::size_t i = 0; i < static_cast<std::size_t>(k); i++) {
    selected[order[i]] = keep;
  }

  std::vector<std::int64_t> survivors;
  for (std::size_t i = 0; i < elements.size(); i++) {
    if (selected[i]) {
      survivors.push_back(elements[i]);
    }
  }
  return Value::List(list.GetListKind(), std::move(survivors));
}

Value Evaluator::EvalCall(const Node &node) {
  std::vector<Value> args;
  args.reserve(node.children.size());
  for (const auto &child : node.children) {
    args.push_back(Eval(*child));
  }
  return registry_.Invoke(node.name, args);
}

} // namespace rollkit::run
