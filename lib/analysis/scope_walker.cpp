// ratchet/analysis/scope_walker.cpp - Depth-first walk with namespace scope tracking
#include "ratchet/analysis/scope_walker.hpp"

namespace ratchet
{

void ScopeWalker::walk(const SyntaxNode & root, const Visitor & visit) const
{
  ScopeStack scope(&root);
  walk_node(root, scope, visit);
}

void ScopeWalker::walk_node(
  const SyntaxNode & node, ScopeStack & scope, const Visitor & visit) const
{
  visit(node, scope);

  const auto decl = opener_.declaration(node);
  if (!decl) {
    for (const SyntaxNode * child : node.children()) {
      walk_node(*child, scope, visit);
    }
    return;
  }

  bool pushed = false;
  for (const SyntaxNode * child : node.children()) {
    const bool in_header = decl->is_header(child);
    if (in_header && pushed) {
      scope.pop();
      pushed = false;
    } else if (!in_header && !pushed) {
      scope.push(&node, decl->name.segments, decl->name.root_anchored);
      pushed = true;
    }
    walk_node(*child, scope, visit);
  }
  if (pushed) {
    scope.pop();
  }
}

}  // namespace ratchet
