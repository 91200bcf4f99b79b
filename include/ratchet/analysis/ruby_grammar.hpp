// ratchet/analysis/ruby_grammar.hpp - tree-sitter-ruby node vocabulary
#pragma once

#include <optional>
#include <string_view>

#include "ratchet/analysis/inspector.hpp"

namespace ratchet::ruby
{

namespace kind
{
inline constexpr std::string_view k_constant = "constant";
inline constexpr std::string_view k_scope_resolution = "scope_resolution";
inline constexpr std::string_view k_class = "class";
inline constexpr std::string_view k_module = "module";
inline constexpr std::string_view k_assignment = "assignment";
inline constexpr std::string_view k_operator_assignment = "operator_assignment";
inline constexpr std::string_view k_call = "call";
inline constexpr std::string_view k_argument_list = "argument_list";
inline constexpr std::string_view k_simple_symbol = "simple_symbol";
inline constexpr std::string_view k_pair = "pair";
inline constexpr std::string_view k_hash_key_symbol = "hash_key_symbol";
inline constexpr std::string_view k_string = "string";
inline constexpr std::string_view k_string_content = "string_content";
}  // namespace kind

namespace field
{
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_scope = "scope";
inline constexpr std::string_view k_superclass = "superclass";
inline constexpr std::string_view k_left = "left";
inline constexpr std::string_view k_receiver = "receiver";
inline constexpr std::string_view k_method = "method";
inline constexpr std::string_view k_arguments = "arguments";
inline constexpr std::string_view k_key = "key";
inline constexpr std::string_view k_value = "value";
}  // namespace field

/**
 * Static constant path spelled by a `constant` or `scope_resolution` node.
 *
 * Returns nullopt when any scope in the chain is not itself a constant
 * (`foo::Bar`, `self.class::X`), since such paths are only known at run time.
 */
[[nodiscard]] std::optional<ConstantName> constant_name_of(const SyntaxNode & node);

/// True for `class` and `module` declarations
[[nodiscard]] bool is_namespace_declaration(const SyntaxNode & node) noexcept;

/**
 * Classes and modules open namespaces; their `name` and `superclass`
 * children belong to the enclosing scope.
 */
class RubyNamespaceOpener final : public NamespaceOpener
{
public:
  [[nodiscard]] std::optional<NamespaceDeclaration> declaration(
    const SyntaxNode & node) const override;
};

}  // namespace ratchet::ruby
