#include "value.hpp"

#include <fmt/format.h>
#include <utility>

namespace rollkit::models {

Value Value::Integer(std::int64_t value) {
  Value result;
  result.integer_ = value;
  return result;
}

Value Value::List(ListKind kind, std::vector<std::int64_t> elements) {
  Value result;
  result.is_list_ = true;
  result.kind_ = kind;
  result.elements_ = std::move(elements);
  return result;
}

std::int64_t Value::Sum() const {
  if (!is_list_) {
    return integer_;
  }
  return WrappingSum(elements_);
}

bool Value::operator==(const Value &other) const {
  if (is_list_ != other.is_list_) {
    return false;
  }
  if (!is_list_) {
    return integer_ == other.integer_;
  }
  return kind_ == other.kind_ && elements_ == other.elements_;
}

std::int64_t WrappingAdd(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) +
                                   static_cast<std::uint64_t>(b));
}

std::int64_t WrappingSub(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) -
                                   static_cast<std::uint64_t>(b));
}

std::int64_t WrappingMul(std::int64_t a, std::int64_t b) {
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) *
                                   static_cast<std::uint64_t>(b));
}

std::int64_t WrappingSum(const std::vector<std::int64_t> &elements) {
  std::int64_t sum = 0;
  for (auto element : elements) {
    sum = WrappingAdd(sum, element);
  }
  return sum;
}

std::string JoinElements(const std::vector<std::int64_t> &elements) {
  return fmt::format("{}", fmt::join(elements, ", "));
}

std::string ToString(const Value &value) {
  if (value.IsInteger()) {
    return fmt::format("{}", value.GetInteger());
  }
  if (value.IsStrong()) {
    return fmt::format("{{{{{}}}}}", JoinElements(value.GetElements()));
  }
  return fmt::format("{{{}}}", JoinElements(value.GetElements()));
}

} // namespace rollkit::models
