#pragma once

#include "../models/value.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rollkit::functions {

/**
 * @brief Signature of every callable function. Failures are thrown as
 * errors::EvalError.
 */
using Callable =
    std::function<models::Value(const std::vector<models::Value> &)>;

/**
 * @brief Accepted argument counts of a function.
 */
struct Arity {
  std::size_t min = 0;            /**< Fewest arguments accepted. */
  std::optional<std::size_t> max; /**< Most arguments accepted, unbounded if empty. */

  bool Accepts(std::size_t count) const;
  std::string ToString() const;
};

/**
 * @struct Function
 * A registered function.
 */
struct Function {
  std::string name;
  Arity arity;
  Callable callable;
};

/**
 * @class Registry
 * @brief Maps function names to callables for call expressions.
 *
 * Lookup is exact and case-sensitive.
 */
class Registry {
public:
  /**
   * @brief Constructs an empty registry.
   */
  Registry();

  /**
   * @brief Registers a function, replacing any function of the same name.
   * @param name The name used in call expressions.
   * @param arity The accepted argument counts.
   * @param callable The implementation.
   */
  void Register(const std::string &name, Arity arity, Callable callable);

  /**
   * @brief Looks up a function by name.
   * @return The function, or nullptr if no function has that name.
   */
  const Function *Lookup(const std::string &name) const;

  /**
   * @brief Checks if a function of the given name is registered.
   */
  bool Contains(const std::string &name) const;

  /**
   * @brief Calls a function with already evaluated arguments.
   * @param name The function name.
   * @param args The argument values.
   * @return The function's result.
   * @throws errors::EvalError UnknownFunction if the name is not registered,
   * InvalidArguments if the argument count does not fit the arity, or
   * whatever the function itself throws.
   */
  models::Value Invoke(const std::string &name,
                       const std::vector<models::Value> &args) const;

  /**
   * @brief Returns the registered names in sorted order.
   */
  std::vector<std::string> GetNames() const;

  /**
   * @brief Get the process registry, populated with the built-in functions.
   * @return The reference to the process registry.
   */
  static Registry &getInstance();

private:
  std::unordered_map<std::string, Function> functions_;
};

/**
 * @brief Registers the built-in functions `sum`, `len`, `max`, `min` and
 * `abs`.
 * @param registry The registry to populate.
 */
void RegisterBuiltins(Registry &registry);

} // namespace rollkit::functions
