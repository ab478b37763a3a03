#include "rollkit.hpp"

#include "functions/registry.hpp"
#include "parser/parser.hpp"
#include "utils/format/explain_viewer.hpp"

namespace rollkit {

models::NodePtr Parse(std::string_view text) { return parser::Parse(text); }

models::Value Eval(const models::Node &node, run::EvalLimits limits) {
  auto random = run::MakeProcessSource();
  return EvalWith(node, random, limits);
}

models::Value EvalWith(const models::Node &node, run::RandomSource &random,
                       run::EvalLimits limits) {
  run::Evaluator evaluator(random, functions::Registry::getInstance(), limits);
  return evaluator.Eval(node);
}

std::string Explain(const models::Node &node) { return format::Explain(node); }

} // namespace rollkit
