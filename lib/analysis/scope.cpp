// ratchet/analysis/scope.cpp - Lexical namespace scope frames
#include "ratchet/analysis/scope.hpp"

namespace ratchet
{

ScopeStack::ScopeStack(const SyntaxNode * root)
{
  ScopeFrame top;
  top.node = root;
  frames_.push_back(std::move(top));
}

void ScopeStack::push(const SyntaxNode * node, NamespacePath segments, bool root_anchored)
{
  ScopeFrame frame;
  frame.node = node;
  frame.path = root_anchored ? segments : innermost().path.concat(segments);
  frame.segments = std::move(segments);
  frames_.push_back(std::move(frame));
}

void ScopeStack::pop()
{
  if (frames_.size() > 1) {
    frames_.pop_back();
  }
}

std::vector<NamespacePath> ScopeStack::nesting() const
{
  std::vector<NamespacePath> out;
  out.reserve(frames_.size());
  for (const auto & frame : *this) {
    out.push_back(frame.path);
  }
  return out;
}

}  // namespace ratchet
