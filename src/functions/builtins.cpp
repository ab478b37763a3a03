#include "registry.hpp"

#include "../errors/errors.hpp"
#include <algorithm>
#include <cstdint>
#include <fmt/core.h>
#include <limits>
#include <utility>
#include <vector>

namespace rollkit::functions {

using models::ListKind;
using models::Value;

namespace {

// Integers of all arguments, lists flattened in order.
std::vector<std::int64_t> Flatten(const std::vector<Value> &args) {
  std::vector<std::int64_t> result;
  for (const auto &arg : args) {
    if (arg.IsInteger()) {
      result.push_back(arg.GetInteger());
    } else {
      const auto &elements = arg.GetElements();
      result.insert(result.end(), elements.begin(), elements.end());
    }
  }
  return result;
}

std::int64_t Abs(std::int64_t value) {
  if (value == std::numeric_limits<std::int64_t>::min()) {
    return value;
  }
  return value < 0 ? -value : value;
}

Value Sum(const std::vector<Value> &args) {
  return Value::Integer(args[0].Sum());
}

Value Len(const std::vector<Value> &args) {
  if (!args[0].IsList()) {
    throw errors::EvalError(errors::EvalErrorKind::kExpectedList,
                            "'len' needs a list argument");
  }
  return Value::Integer(
      static_cast<std::int64_t>(args[0].GetElements().size()));
}

Value Extreme(const char *name, const std::vector<Value> &args, bool highest) {
  auto values = Flatten(args);
  if (values.empty()) {
    throw errors::EvalError(errors::EvalErrorKind::kInvalidArguments,
                            fmt::format("'{}' of no values", name));
  }
  auto it = highest ? std::max_element(values.begin(), values.end())
                    : std::min_element(values.begin(), values.end());
  return Value::Integer(*it);
}

Value AbsValue(const std::vector<Value> &args) {
  const auto &arg = args[0];
  if (!arg.IsStrong()) {
    return Value::Integer(Abs(arg.Sum()));
  }
  std::vector<std::int64_t> result;
  result.reserve(arg.GetElements().size());
  for (auto element : arg.GetElements()) {
    result.push_back(Abs(element));
  }
  return Value::List(ListKind::kStrong, std::move(result));
}

} // namespace

void RegisterBuiltins(Registry &registry) {
  registry.Register("sum", Arity{1, 1}, Sum);
  registry.Register("len", Arity{1, 1}, Len);
  registry.Register("max", Arity{1, std::nullopt},
                    [](const std::vector<Value> &args) {
                      return Extreme("max", args, true);
                    });
  registry.Register("min", Arity{1, std::nullopt},
                    [](const std::vector<Value> &args) {
                      return Extreme("min", args, false);
                    });
  registry.Register("abs", Arity{1, 1}, AbsValue);
}

} // namespace rollkit::functions
