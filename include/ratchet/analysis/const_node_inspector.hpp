// ratchet/analysis/const_node_inspector.hpp - Constant read inspector
#pragma once

#include "ratchet/analysis/inspector.hpp"

namespace ratchet
{

/**
 * Reports constant reads: `Foo`, `Foo::Bar`, `::Foo`, and the constant part
 * of navigation such as `Foo::Bar.baz`.
 *
 * Only the outermost node of a qualified path is reported. Declared names
 * of classes and modules and the targets of constant assignments are
 * definitions, not references, and are skipped.
 */
class ConstNodeInspector final : public ConstantNameInspector
{
public:
  [[nodiscard]] std::optional<UnresolvedReference> inspect(
    const SyntaxNode & node, const ScopeStack & scope,
    const std::string & relative_path) const override;
};

}  // namespace ratchet
