// ratchet/analysis/inspector.hpp - Constant-reference inspector contract
//
// Inspectors recognize constant accesses in a syntax tree. They are pure:
// they read the node (and its ancestors through parent links) and the scope
// stack active at the node, and never mutate or perform I/O.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ratchet/analysis/scope.hpp"
#include "ratchet/basic/source_manager.hpp"
#include "ratchet/naming/namespace_path.hpp"
#include "ratchet/syntax/syntax_tree.hpp"

namespace ratchet
{

/**
 * A constant name as written: `Foo`, `Foo::Bar`, or root-anchored `::Foo`.
 */
struct ConstantName
{
  bool root_anchored = false;
  NamespacePath segments;

  /// Spelling as written, e.g. "::Foo::Bar"
  [[nodiscard]] std::string spelling() const
  {
    return (root_anchored ? "::" : "") + segments.qualified_name();
  }
};

/**
 * A constant access found in a source file, not yet bound to a definition.
 *
 * `scope` holds pointers into the syntax tree it was collected from; the
 * reference must be resolved while that tree is alive.
 */
struct UnresolvedReference
{
  ConstantName name;
  ScopeStack scope;
  std::string relative_path;
  SourceRange range;
};

// ============================================================================
// NamespaceOpener
// ============================================================================

/**
 * What a namespace-opening declaration introduces.
 *
 * `header` lists the declaration's children that are evaluated in the
 * enclosing scope (e.g. the declared name and the superclass expression).
 */
struct NamespaceDeclaration
{
  ConstantName name;
  std::vector<const SyntaxNode *> header;

  [[nodiscard]] bool is_header(const SyntaxNode * node) const
  {
    for (const SyntaxNode * h : header) {
      if (h == node) return true;
    }
    return false;
  }
};

/**
 * Grammar capability used by the scope walker to learn which nodes open a
 * namespace, keeping the walker independent of any concrete grammar.
 */
class NamespaceOpener
{
public:
  virtual ~NamespaceOpener() = default;

  /// The declaration `node` opens, or nullopt when it opens no namespace
  [[nodiscard]] virtual std::optional<NamespaceDeclaration> declaration(
    const SyntaxNode & node) const = 0;
};

// ============================================================================
// ConstantNameInspector
// ============================================================================

class ConstantNameInspector
{
public:
  virtual ~ConstantNameInspector() = default;

  /**
   * Inspect one node.
   *
   * @param node Node to inspect; ancestors are reachable via parent()
   * @param scope Scope stack active at `node`
   * @param relative_path Label of the file being analyzed
   * @return The reference `node` denotes, or nullopt
   */
  [[nodiscard]] virtual std::optional<UnresolvedReference> inspect(
    const SyntaxNode & node, const ScopeStack & scope, const std::string & relative_path) const = 0;
};

}  // namespace ratchet
