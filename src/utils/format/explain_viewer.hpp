#pragma once

#include "../../models/node.hpp"

#include <string>

namespace rollkit::format {
/**
 * @class ExplainViewer
 * @brief Renders the structure of an expression tree, one node per line,
 * indented two spaces per nesting level.
 *
 * Rendering is purely structural: nothing is evaluated and no randomness is
 * consumed, so the same tree always yields the same text.
 */
class ExplainViewer {
public:
  /**
   * @brief Constructs a viewer.
   * @param base_indent Nesting level of the root node.
   */
  explicit ExplainViewer(int base_indent = 0);

  /**
   * @brief Renders the tree rooted at `node`.
   * @param node The root.
   * @return The rendering, lines separated by '\n', without a trailing newline.
   */
  std::string view(const models::Node &node);

private:
  void visit(const models::Node &node, const std::string &label);
  void visit_children(const models::Node &node);
  /**
   * @brief Appends one line at the current indentation.
   * @param text The line content.
   */
  void start_new_line(const std::string &text);

  std::string doindent() const;
  /**
   * @brief Decreases the current indentation level.
   */
  void decrease_indentation();
  /**
   * @brief Increases the current indentation level.
   */
  void increase_indentation();

  std::string buffer_;
  int indent = 0;
};

/**
 * @brief Renders the structure of an expression tree.
 * @param node The root.
 * @return The rendering produced by ExplainViewer.
 */
std::string Explain(const models::Node &node);

/**
 * @brief Renders an expression on one line, fully parenthesised, e.g.
 * `((4 d 6) kh 3)`. Parsing the result gives back the same tree.
 * @param node The root.
 * @return The single-line form.
 */
std::string FormatInline(const models::Node &node);

} // namespace rollkit::format
