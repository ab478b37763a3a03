#pragma once

#include "node.hpp"
#include "value.hpp"

#include <cstdint>

namespace rollkit::models {

/**
 * @brief Applies an arithmetic or comparison operator to two integers.
 *
 * Arithmetic wraps on overflow; comparisons yield 1 for true and 0 for false.
 *
 * @param op One of kMul, kAdd, kSub, kEq, kNe, kLt, kLe, kGt, kGe.
 * @param left The left operand.
 * @param right The right operand.
 * @return The result of `left op right`.
 */
std::int64_t ApplyScalar(BinaryOperator op, std::int64_t left,
                         std::int64_t right);

/**
 * @brief Combines two values under an arithmetic or comparison operator.
 *
 * Normal lists are reduced to their sums first. Integer with Integer gives an
 * Integer. A Strong list against a scalar is broadcast element-wise, and two
 * Strong lists are combined pairwise by index; both give a Strong list.
 *
 * @param op One of kMul, kAdd, kSub, kEq, kNe, kLt, kLe, kGt, kGe.
 * @param left The left operand.
 * @param right The right operand.
 * @return The combined value.
 * @throws errors::EvalError LengthMismatch when two Strong lists differ in
 * length.
 */
Value Combine(BinaryOperator op, const Value &left, const Value &right);

} // namespace rollkit::models
