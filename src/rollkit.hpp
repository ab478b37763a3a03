#pragma once

/**
 * @file
 * @brief Library entry points: parse an expression, evaluate it, explain it.
 */

#include "models/node.hpp"
#include "models/value.hpp"
#include "run/eval.hpp"
#include "run/random_source.hpp"

#include <string>
#include <string_view>

#define ROLLKIT_VERSION "0.1.0"

namespace rollkit {

/**
 * @brief Parses dice notation into an expression tree.
 * @param text The expression, e.g. "4d6kh3 + 2".
 * @return The root of the tree.
 * @throws errors::LexError, errors::ParseError
 */
models::NodePtr Parse(std::string_view text);

/**
 * @brief Evaluates a tree with a fresh source seeded from the process seed.
 * @param node The root of the tree.
 * @param limits Bounds on list sizes.
 * @return The value of the expression.
 * @throws errors::EvalError
 */
models::Value Eval(const models::Node &node,
                   run::EvalLimits limits = run::EvalLimits());

/**
 * @brief Evaluates a tree drawing dice from the given source.
 *
 * The source is used exclusively for the duration of the call and keeps its
 * state afterwards, so sequential calls continue one reproducible sequence.
 *
 * @param node The root of the tree.
 * @param random The random source.
 * @param limits Bounds on list sizes.
 * @return The value of the expression.
 * @throws errors::EvalError
 */
models::Value EvalWith(const models::Node &node, run::RandomSource &random,
                       run::EvalLimits limits = run::EvalLimits());

/**
 * @brief Renders the structure of a tree without evaluating it.
 * @param node The root of the tree.
 * @return One line per node, indented by depth.
 */
std::string Explain(const models::Node &node);

} // namespace rollkit
