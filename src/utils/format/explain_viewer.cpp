#include "explain_viewer.hpp"

#include "../../run/eval.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <fmt/format.h>
#include <vector>

namespace rollkit::format {

using models::Node;
using models::NodeKind;

namespace {

bool AllIntegerLiterals(const Node &node) {
  return std::all_of(node.children.begin(), node.children.end(),
                     [](const models::NodePtr &child) {
                       return child->kind == NodeKind::kIntegerLiteral;
                     });
}

std::vector<std::string> InlineChildren(const Node &node) {
  std::vector<std::string> parts;
  parts.reserve(node.children.size());
  for (const auto &child : node.children) {
    parts.push_back(FormatInline(*child));
  }
  return parts;
}

} // namespace

ExplainViewer::ExplainViewer(int base_indent) : indent(base_indent) {}

std::string ExplainViewer::doindent() const {
  return std::string(static_cast<std::size_t>(std::max(indent, 0)) * 2, ' ');
}
void ExplainViewer::decrease_indentation() { indent--; }
void ExplainViewer::increase_indentation() { indent++; }

void ExplainViewer::start_new_line(const std::string &text) {
  if (!buffer_.empty()) {
    buffer_ += '\n';
  }
  buffer_ += doindent();
  buffer_ += text;
}

std::string ExplainViewer::view(const Node &node) {
  buffer_.clear();
  visit(node, "");
  return buffer_;
}

void ExplainViewer::visit_children(const Node &node) {
  increase_indentation();
  for (const auto &child : node.children) {
    visit(*child, "");
  }
  decrease_indentation();
}

void ExplainViewer::visit(const Node &node, const std::string &label) {
  switch (node.kind) {
  case NodeKind::kIntegerLiteral:
    start_new_line(fmt::format("{}Literal: {} (Integer)", label, node.value));
    return;

  case NodeKind::kExplicitListLiteral:
    if (AllIntegerLiterals(node)) {
      start_new_line(fmt::format("{}Literal: {{{}}} (List with {} elements)",
                                 label, fmt::join(InlineChildren(node), ", "),
                                 node.children.size()));
      return;
    }
    start_new_line(fmt::format("{}List Literal (List with {} elements)", label,
                               node.children.size()));
    visit_children(node);
    return;

  case NodeKind::kRangeListLiteral:
    if (AllIntegerLiterals(node) &&
        (!node.HasStep() || node.children[2]->value != 0)) {
      std::int64_t step = node.HasStep() ? node.children[2]->value : 1;
      start_new_line(fmt::format(
          "{}Literal: [{}] (Range with {} elements)", label,
          fmt::join(InlineChildren(node), ", "),
          run::RangeLength(node.children[0]->value, node.children[1]->value,
                           step)));
      return;
    }
    start_new_line(fmt::format("{}Range Literal", label));
    increase_indentation();
    visit(*node.children[0], "Start: ");
    visit(*node.children[1], "End: ");
    if (node.HasStep()) {
      visit(*node.children[2], "Step: ");
    }
    decrease_indentation();
    return;

  case NodeKind::kStrongWrap:
    start_new_line(fmt::format("{}Strong List:", label));
    visit_children(node);
    return;

  case NodeKind::kBinaryOp:
    start_new_line(fmt::format("{}Binary Operation: {} ({})", label,
                               models::ToSymbol(node.op),
                               models::Describe(node.op)));
    visit_children(node);
    return;

  case NodeKind::kCall:
    start_new_line(fmt::format("{}Function Call: {} ({} args)", label,
                               node.name, node.children.size()));
    visit_children(node);
    return;
  }
}

std::string Explain(const Node &node) {
  ExplainViewer viewer;
  return viewer.view(node);
}

std::string FormatInline(const Node &node) {
  switch (node.kind) {
  case NodeKind::kIntegerLiteral:
    return fmt::format("{}", node.value);
  case NodeKind::kExplicitListLiteral:
    // A lone element needs the trailing comma or it would read as a strong
    // wrap.
    if (node.children.size() == 1) {
      return fmt::format("{{{},}}", FormatInline(*node.children[0]));
    }
    return fmt::format("{{{}}}", fmt::join(InlineChildren(node), ", "));
  case NodeKind::kRangeListLiteral:
    return fmt::format("[{}]", fmt::join(InlineChildren(node), ", "));
  case NodeKind::kStrongWrap:
    return fmt::format("{{{}}}", FormatInline(node.Left()));
  case NodeKind::kBinaryOp:
    return fmt::format("({} {} {})", FormatInline(node.Left()),
                       models::ToSymbol(node.op), FormatInline(node.Right()));
  case NodeKind::kCall:
    return fmt::format("{}({})", node.name,
                       fmt::join(InlineChildren(node), ", "));
  }
  return "";
}

} // namespace rollkit::format
