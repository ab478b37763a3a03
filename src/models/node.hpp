#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rollkit::models {

/**
 * @brief Structural category of an AST node.
 */
enum class NodeKind {
  kIntegerLiteral,
  kExplicitListLiteral,
  kRangeListLiteral,
  kStrongWrap,
  kBinaryOp,
  kCall
};

/**
 * @brief Binary operators, highest precedence first.
 */
enum class BinaryOperator {
  kDice,
  kKeepHigh,
  kKeepLow,
  kDropHigh,
  kDropLow,
  kMul,
  kAdd,
  kSub,
  kEq,
  kNe,
  kLt,
  kLe,
  kGt,
  kGe
};

/**
 * @brief Returns the binding power of an operator. Larger binds tighter.
 */
int Precedence(BinaryOperator op);

/**
 * @brief Checks whether an operator groups to the right.
 */
bool IsRightAssociative(BinaryOperator op);

/**
 * @brief Returns the source symbol of an operator, e.g. "kh".
 */
std::string ToSymbol(BinaryOperator op);

/**
 * @brief Returns the human-readable name of an operator, e.g. "Keep Highest".
 */
std::string Describe(BinaryOperator op);

struct Node;
using NodePtr = std::unique_ptr<Node>;

/**
 * @struct Node
 * Structure representing one node of the expression tree.
 *
 * Each node owns its children exclusively. Which fields are meaningful
 * depends on `kind`:
 * - kIntegerLiteral: `value`.
 * - kExplicitListLiteral: `children` are the elements.
 * - kRangeListLiteral: `children` are start, end and, optionally, step.
 * - kStrongWrap: `children[0]` is the wrapped expression.
 * - kBinaryOp: `op`, `children[0]` is the left operand, `children[1]` the
 *   right one.
 * - kCall: `name`, `children` are the arguments.
 */
struct Node {
  NodeKind kind;                 /**< Node kind. */
  std::int64_t value = 0;        /**< Integer literal value. */
  BinaryOperator op;             /**< Operator of a binary node. */
  std::string name;              /**< Function name of a call. */
  std::vector<NodePtr> children; /**< Owned child nodes. */
  std::size_t position = 0;      /**< Byte offset of the node in the source. */

  const Node &Left() const { return *children[0]; }
  const Node &Right() const { return *children[1]; }
  bool HasStep() const { return children.size() > 2; }

  static NodePtr MakeInteger(std::int64_t value, std::size_t position);
  static NodePtr MakeList(std::vector<NodePtr> elements, std::size_t position);
  static NodePtr MakeRange(NodePtr start, NodePtr end, NodePtr step,
                           std::size_t position);
  static NodePtr MakeStrong(NodePtr inner, std::size_t position);
  static NodePtr MakeBinary(BinaryOperator op, NodePtr left, NodePtr right,
                            std::size_t position);
  static NodePtr MakeCall(const std::string &name, std::vector<NodePtr> args,
                          std::size_t position);
};

} // namespace rollkit::models
