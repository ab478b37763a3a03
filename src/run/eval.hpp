#pragma once

#include "../functions/registry.hpp"
#include "../models/node.hpp"
#include "../models/value.hpp"
#include "random_source.hpp"

#include <cstddef>
#include <cstdint>

namespace rollkit::run {

/**
 * @brief Bounds on the work one evaluation may do.
 */
struct EvalLimits {
  /**
   * @brief Longest list a range literal or dice roll may produce.
   */
  std::size_t max_list_length = 1000000;
};

/**
 * @class Evaluator
 * @brief Evaluates an expression tree depth-first, left operand before right.
 *
 * The only side effect is consumption of the random source, one draw per die
 * in roll order. The tree is never modified.
 */
class Evaluator {
public:
  /**
   * @brief Constructs an evaluator.
   * @param random The random source used for dice; borrowed for the
   * evaluator's lifetime.
   * @param registry The functions available to call expressions.
   * @param limits Bounds on list sizes.
   */
  Evaluator(RandomSource &random,
            const functions::Registry &registry =
                functions::Registry::getInstance(),
            EvalLimits limits = EvalLimits());

  /**
   * @brief Evaluates an expression tree.
   * @param node The root of the tree.
   * @return The value of the expression.
   * @throws errors::EvalError on the first failure; no partial result.
   */
  models::Value Eval(const models::Node &node);

private:
  models::Value EvalExplicitList(const models::Node &node);
  models::Value EvalRange(const models::Node &node);
  models::Value EvalStrongWrap(const models::Node &node);
  models::Value EvalBinary(const models::Node &node);
  models::Value EvalDice(const models::Value &count,
                         const models::Value &faces);
  models::Value EvalKeepDrop(models::BinaryOperator op,
                             const models::Value &list,
                             const models::Value &count);
  models::Value EvalCall(const models::Node &node);

  void CheckLength(std::uint64_t length, const char *what) const;
  std::int64_t Draw(std::int64_t lo, std::int64_t hi);

  RandomSource &random_;
  const functions::Registry &registry_;
  EvalLimits limits_;
};

/**
 * @brief Reduces a value to an integer: a Normal list to its sum.
 * @param value The value to reduce.
 * @param what What the integer is used for, for the error message.
 * @return The integer.
 * @throws errors::EvalError ExpectedInteger for a Strong list.
 */
std::int64_t ToInteger(const models::Value &value, const char *what);

/**
 * @brief Computes the number of elements of an inclusive range.
 *
 * The direction follows `start` and `end`; only the magnitude of `step`
 * counts. Saturates at the largest std::uint64_t.
 *
 * @param step Must be non-zero.
 */
std::uint64_t RangeLength(std::int64_t start, std::int64_t end,
                          std::int64_t step);

} // namespace rollkit::run
