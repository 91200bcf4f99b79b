// ratchet/analysis/scope_walker.hpp - Depth-first walk with namespace scope tracking
#pragma once

#include <functional>

#include "ratchet/analysis/inspector.hpp"
#include "ratchet/analysis/scope.hpp"
#include "ratchet/syntax/syntax_tree.hpp"

namespace ratchet
{

/**
 * Pre-order depth-first traversal that pairs every node with the namespace
 * scope stack active at it.
 *
 * Only declarations reported by the NamespaceOpener push frames; any other
 * ancestor (method bodies, blocks, conditionals) is traversed without
 * touching the stack. A declaration's header children are visited with the
 * enclosing stack, the rest of its children with the declaration's frame
 * pushed. Each node is visited exactly once; recursion depth is bounded by
 * the depth of the tree.
 */
class ScopeWalker
{
public:
  using Visitor = std::function<void(const SyntaxNode &, const ScopeStack &)>;

  explicit ScopeWalker(const NamespaceOpener & opener) : opener_(opener) {}

  void walk(const SyntaxNode & root, const Visitor & visit) const;

private:
  void walk_node(const SyntaxNode & node, ScopeStack & scope, const Visitor & visit) const;

  const NamespaceOpener & opener_;
};

}  // namespace ratchet
