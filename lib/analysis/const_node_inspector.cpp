// ratchet/analysis/const_node_inspector.cpp - Constant read inspector
#include "ratchet/analysis/const_node_inspector.hpp"

#include "ratchet/analysis/ruby_grammar.hpp"

namespace ratchet
{

namespace
{

bool is_assignment_target(const SyntaxNode & node, const SyntaxNode & parent)
{
  return (parent.is(ruby::kind::k_assignment) || parent.is(ruby::kind::k_operator_assignment)) &&
         node.field() == ruby::field::k_left;
}

// Nodes that spell part of a constant but are not a read of that constant.
bool is_not_a_read(const SyntaxNode & node, const SyntaxNode & parent)
{
  // Inner part of a longer path; the outermost node reports it.
  if (
    parent.is(ruby::kind::k_scope_resolution) &&
    (node.field() == ruby::field::k_scope || node.field() == ruby::field::k_name)) {
    return true;
  }
  // `Integer(x)`, `Foo::Bar(1)`: a method named like a constant.
  if (parent.is(ruby::kind::k_call) && node.field() == ruby::field::k_method) {
    return true;
  }
  return ruby::is_namespace_declaration(parent) && node.field() == ruby::field::k_name;
}

}  // namespace

std::optional<UnresolvedReference> ConstNodeInspector::inspect(
  const SyntaxNode & node, const ScopeStack & scope, const std::string & relative_path) const
{
  if (!node.is(ruby::kind::k_constant) && !node.is(ruby::kind::k_scope_resolution)) {
    return std::nullopt;
  }

  const SyntaxNode * read = &node;
  if (const SyntaxNode * parent = node.parent()) {
    if (is_not_a_read(node, *parent)) {
      return std::nullopt;
    }
    if (is_assignment_target(node, *parent)) {
      // `LIMIT = 1` defines; `Order::LIMIT = 1` still reads `Order`.
      read = node.is(ruby::kind::k_scope_resolution) ? node.child_by_field(ruby::field::k_scope)
                                                     : nullptr;
      if (read == nullptr) {
        return std::nullopt;
      }
    }
  }

  auto name = ruby::constant_name_of(*read);
  if (!name) {
    return std::nullopt;
  }

  return UnresolvedReference{std::move(*name), scope, relative_path, read->range()};
}

}  // namespace ratchet
