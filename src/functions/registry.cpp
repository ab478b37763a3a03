#include "registry.hpp"

#include "../errors/errors.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <utility>

namespace rollkit::functions {

bool Arity::Accepts(std::size_t count) const {
  return count >= min && (!max.has_value() || count <= max.value());
}

std::string Arity::ToString() const {
  if (!max.has_value()) {
    return fmt::format("at least {}", min);
  }
  if (max.value() == min) {
    return fmt::format("exactly {}", min);
  }
  return fmt::format("{} to {}", min, max.value());
}

Registry::Registry() : functions_() {}

void Registry::Register(const std::string &name, Arity arity,
                        Callable callable) {
  functions_[name] = Function{name, arity, std::move(callable)};
}

const Function *Registry::Lookup(const std::string &name) const {
  auto it = functions_.find(name);
  if (it == functions_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool Registry::Contains(const std::string &name) const {
  return Lookup(name) != nullptr;
}

models::Value Registry::Invoke(const std::string &name,
                               const std::vector<models::Value> &args) const {
  const Function *function = Lookup(name);
  if (function == nullptr) {
    throw errors::EvalError(errors::EvalErrorKind::kUnknownFunction,
                            fmt::format("no function named '{}'", name));
  }
  if (!function->arity.Accepts(args.size())) {
    throw errors::EvalError(
        errors::EvalErrorKind::kInvalidArguments,
        fmt::format("'{}' takes {} arguments, got {}", name,
                    function->arity.ToString(), args.size()));
  }
  return function->callable(args);
}

std::vector<std::string> Registry::GetNames() const {
  std::vector<std::string> names;
  names.reserve(functions_.size());
  for (const auto &entry : functions_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

Registry &Registry::getInstance() {
  static Registry instance = [] {
    Registry registry;
    RegisterBuiltins(registry);
    return registry;
  }();
  return instance;
}

} // namespace rollkit::functions
