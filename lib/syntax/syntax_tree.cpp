// ratchet/syntax/syntax_tree.cpp - Syntax tree implementation
#include "ratchet/syntax/syntax_tree.hpp"

namespace ratchet
{

const SyntaxNode * SyntaxNode::child_by_field(std::string_view field) const noexcept
{
  for (const SyntaxNode * child : children_) {
    if (child->field() == field) {
      return child;
    }
  }
  return nullptr;
}

SyntaxNode * SyntaxTree::add_node(
  std::string_view kind, std::string_view field, SourceRange range, SyntaxNode * parent)
{
  SyntaxNode & node = nodes_.emplace_back(kind, field, range);
  node.text_ = source_.get_source_slice(range);
  node.parent_ = parent;
  if (parent == nullptr) {
    root_ = &node;
  } else {
    parent->children_.push_back(&node);
  }
  return &node;
}

}  // namespace ratchet
