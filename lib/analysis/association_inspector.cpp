// ratchet/analysis/association_inspector.cpp - Model association inspector
#include "ratchet/analysis/association_inspector.hpp"

#include "ratchet/analysis/ruby_grammar.hpp"

namespace ratchet
{

namespace
{

enum class AssociationKind { Singular, Collection };

std::optional<AssociationKind> association_kind(std::string_view method)
{
  if (method == "belongs_to" || method == "has_one") {
    return AssociationKind::Singular;
  }
  if (method == "has_many" || method == "has_and_belongs_to_many") {
    return AssociationKind::Collection;
  }
  return std::nullopt;
}

/// Literal content of a plain (non-interpolated) string node
std::optional<std::string_view> string_literal(const SyntaxNode & node)
{
  if (!node.is(ruby::kind::k_string)) {
    return std::nullopt;
  }
  const auto children = node.children();
  if (children.size() != 1 || !children[0]->is(ruby::kind::k_string_content)) {
    return std::nullopt;
  }
  return children[0]->text();
}

/// Value of the `class_name:` option; an empty view when the option is absent
std::optional<std::string_view> class_name_option(const SyntaxNode & arguments)
{
  for (const SyntaxNode * arg : arguments.children()) {
    if (!arg->is(ruby::kind::k_pair)) {
      continue;
    }
    const SyntaxNode * key = arg->child_by_field(ruby::field::k_key);
    const SyntaxNode * value = arg->child_by_field(ruby::field::k_value);
    if (key == nullptr || value == nullptr || !key->is(ruby::kind::k_hash_key_symbol)) {
      continue;
    }
    if (key->text() == "class_name") {
      return string_literal(*value);
    }
  }
  return std::string_view();
}

}  // namespace

std::optional<UnresolvedReference> AssociationInspector::inspect(
  const SyntaxNode & node, const ScopeStack & scope, const std::string & relative_path) const
{
  if (!node.is(ruby::kind::k_call) || node.child_by_field(ruby::field::k_receiver) != nullptr) {
    return std::nullopt;
  }

  const SyntaxNode * method = node.child_by_field(ruby::field::k_method);
  const SyntaxNode * arguments = node.child_by_field(ruby::field::k_arguments);
  if (method == nullptr || arguments == nullptr || arguments->children().empty()) {
    return std::nullopt;
  }

  const auto kind = association_kind(method->text());
  if (!kind) {
    return std::nullopt;
  }

  const SyntaxNode * symbol = arguments->children()[0];
  if (!symbol->is(ruby::kind::k_simple_symbol) || symbol->text().size() < 2) {
    return std::nullopt;
  }

  const auto class_name = class_name_option(*arguments);
  if (!class_name) {
    // class_name: given, but not as a literal
    return std::nullopt;
  }

  ConstantName name;
  if (!class_name->empty()) {
    auto path = NamespacePath::parse(*class_name);
    if (!path || path->empty()) {
      return std::nullopt;
    }
    name.root_anchored = class_name->substr(0, 2) == "::";
    name.segments = std::move(*path);
  } else {
    std::string association(symbol->text().substr(1));
    if (*kind == AssociationKind::Collection) {
      association = inflector_.singularize(association);
    }
    name.segments = NamespacePath{inflector_.camelize(association)};
  }

  return UnresolvedReference{std::move(name), scope, relative_path, symbol->range()};
}

}  // namespace ratchet
