#include "combine.hpp"

#include "../errors/errors.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rollkit::models {

std::int64_t ApplyScalar(BinaryOperator op, std::int64_t left,
                         std::int64_t right) {
  switch (op) {
  case BinaryOperator::kMul:
    return WrappingMul(left, right);
  case BinaryOperator::kAdd:
    return WrappingAdd(left, right);
  case BinaryOperator::kSub:
    return WrappingSub(left, right);
  case BinaryOperator::kEq:
    return left == right ? 1 : 0;
  case BinaryOperator::kNe:
    return left != right ? 1 : 0;
  case BinaryOperator::kLt:
    return left < right ? 1 : 0;
  case BinaryOperator::kLe:
    return left <= right ? 1 : 0;
  case BinaryOperator::kGt:
    return left > right ? 1 : 0;
  case BinaryOperator::kGe:
    return left >= right ? 1 : 0;
  default:
    break;
  }
  throw std::logic_error(
      fmt::format("operator '{}' is not arithmetic", ToSymbol(op)));
}

Value Combine(BinaryOperator op, const Value &left, const Value &right) {
  if (!left.IsStrong() && !right.IsStrong()) {
    return Value::Integer(ApplyScalar(op, left.Sum(), right.Sum()));
  }

  std::vector<std::int64_t> result;
  if (left.IsStrong() && right.IsStrong()) {
    const auto &lhs = left.GetElements();
    const auto &rhs = right.GetElements();
    if (lhs.size() != rhs.size()) {
      throw errors::EvalError(
          errors::EvalErrorKind::kLengthMismatch,
          fmt::format("left list has {} elements, right list has {} elements",
                      lhs.size(), rhs.size()));
    }
    result.reserve(lhs.size());
    for (std::size_t i = 0; i < lhs.size(); i++) {
      result.push_back(ApplyScalar(op, lhs[i], rhs[i]));
    }
  } else if (left.IsStrong()) {
    auto scalar = right.Sum();
    result.reserve(left.GetElements().size());
    for (auto element : left.GetElements()) {
      result.push_back(ApplyScalar(op, element, scalar));
    }
  } else {
    auto scalar = left.Sum();
    result.reserve(right.GetElements().size());
    for (auto element : right.GetElements()) {
      result.push_back(ApplyScalar(op, scalar, element));
    }
  }
  return Value::List(ListKind::kStrong, std::move(result));
}

} // namespace rollkit::models
