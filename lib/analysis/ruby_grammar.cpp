// ratchet/analysis/ruby_grammar.cpp - tree-sitter-ruby node vocabulary
#include "ratchet/analysis/ruby_grammar.hpp"

namespace ratchet::ruby
{

namespace
{

bool append_segments(const SyntaxNode & node, ConstantName & out)
{
  if (node.is(kind::k_constant)) {
    out.segments.push_back(std::string(node.text()));
    return true;
  }
  if (!node.is(kind::k_scope_resolution)) {
    return false;
  }

  const SyntaxNode * name = node.child_by_field(field::k_name);
  if (name == nullptr || !name->is(kind::k_constant)) {
    return false;
  }

  const SyntaxNode * scope = node.child_by_field(field::k_scope);
  if (scope == nullptr) {
    // `::Foo`
    out.root_anchored = true;
  } else if (!append_segments(*scope, out)) {
    return false;
  }

  out.segments.push_back(std::string(name->text()));
  return true;
}

}  // namespace

std::optional<ConstantName> constant_name_of(const SyntaxNode & node)
{
  ConstantName name;
  if (!append_segments(node, name)) {
    return std::nullopt;
  }
  return name;
}

bool is_namespace_declaration(const SyntaxNode & node) noexcept
{
  return node.is(kind::k_class) || node.is(kind::k_module);
}

std::optional<NamespaceDeclaration> RubyNamespaceOpener::declaration(const SyntaxNode & node) const
{
  if (!is_namespace_declaration(node)) {
    return std::nullopt;
  }

  const SyntaxNode * name_node = node.child_by_field(field::k_name);
  if (name_node == nullptr) {
    return std::nullopt;
  }

  auto name = constant_name_of(*name_node);
  if (!name) {
    return std::nullopt;
  }

  NamespaceDeclaration decl;
  decl.name = std::move(*name);
  decl.header.push_back(name_node);
  if (const SyntaxNode * superclass = node.child_by_field(field::k_superclass)) {
    decl.header.push_back(superclass);
  }
  return decl;
}

}  // namespace ratchet::ruby
