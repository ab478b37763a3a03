#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rollkit::models {

/**
 * @brief Subtype of a list value.
 *
 * A Normal list collapses to the sum of its elements when it meets an
 * arithmetic or comparison operator. A Strong list never collapses; operators
 * apply to it element by element.
 */
enum class ListKind { kNormal, kStrong };

/**
 * @class Value
 * @brief Result of evaluating an expression: an Integer or a typed List.
 *
 * Values are immutable. Operators build new values instead of changing their
 * operands.
 */
class Value {
public:
  /**
   * @brief Creates an Integer value.
   */
  static Value Integer(std::int64_t value);

  /**
   * @brief Creates a List value.
   * @param kind Normal or Strong.
   * @param elements The elements, possibly empty.
   */
  static Value List(ListKind kind, std::vector<std::int64_t> elements);

  bool IsInteger() const { return !is_list_; }
  bool IsList() const { return is_list_; }
  bool IsStrong() const { return is_list_ && kind_ == ListKind::kStrong; }
  bool IsNormal() const { return is_list_ && kind_ == ListKind::kNormal; }

  /**
   * @brief Returns the integer of an Integer value.
   */
  std::int64_t GetInteger() const { return integer_; }

  /**
   * @brief Returns the subtype of a List value.
   */
  ListKind GetListKind() const { return kind_; }

  /**
   * @brief Returns the elements of a List value.
   */
  const std::vector<std::int64_t> &GetElements() const { return elements_; }

  /**
   * @brief Returns the integer of an Integer, or the wrapping sum of a List's
   * elements. An empty list sums to 0.
   */
  std::int64_t Sum() const;

  bool operator==(const Value &other) const;
  bool operator!=(const Value &other) const { return !(*this == other); }

private:
  Value() = default;

  bool is_list_ = false;
  std::int64_t integer_ = 0;
  ListKind kind_ = ListKind::kNormal;
  std::vector<std::int64_t> elements_;
};

/**
 * @brief Sums integers with two's complement wrap-around.
 */
std::int64_t WrappingSum(const std::vector<std::int64_t> &elements);

std::int64_t WrappingAdd(std::int64_t a, std::int64_t b);
std::int64_t WrappingSub(std::int64_t a, std::int64_t b);
std::int64_t WrappingMul(std::int64_t a, std::int64_t b);

/**
 * @brief Renders a value: `7`, `{1, 2}` for a Normal list, `{{1, 2}}` for a
 * Strong list.
 */
std::string ToString(const Value &value);

/**
 * @brief Joins integers with ", ".
 */
std::string JoinElements(const std::vector<std::int64_t> &elements);

} // namespace rollkit::models
