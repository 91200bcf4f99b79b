// ratchet/analysis/constant_resolver.hpp - Constant lookup simulation
//
// Binds a constant reference to the fully-qualified path Ruby would bind it
// to, restricted to the namespaces the autoload index knows about.
//
#pragma once

#include <optional>

#include "ratchet/analysis/inspector.hpp"
#include "ratchet/analysis/reference.hpp"
#include "ratchet/index/namespace_index.hpp"

namespace ratchet
{

/**
 * Lexical constant lookup against a NamespaceIndex.
 *
 * Lookup order:
 *  1. A root-anchored name (`::A::B`) is taken as written; the scope stack
 *     is not consulted.
 *  2. Otherwise each frame of the scope stack, innermost first and ending
 *     with the top level, is tried: the first frame path P for which
 *     P + first_segment is known to the index wins.
 *  3. The remaining segments are appended to the winning candidate without
 *     any further lexical search.
 *
 * Ancestry (superclass / included module) lookup is not performed; it
 * would need whole-program type information.
 */
class ConstantResolver
{
public:
  explicit ConstantResolver(const NamespaceIndex & index) : index_(index) {}

  /**
   * Fully-qualified path the reference binds to, if that path is known to
   * the index (whether or not it has a defining file).
   */
  [[nodiscard]] std::optional<NamespacePath> resolve_path(
    const ConstantName & name, const ScopeStack & scope) const;

  /**
   * Resolve a reference to a constant with a defining file.
   *
   * Returns nullopt for references that are unknown to the index (usually
   * constants from outside the project) and for pure namespaces without a
   * defining file.
   */
  [[nodiscard]] std::optional<ConstantContext> resolve(const UnresolvedReference & ref) const;

private:
  const NamespaceIndex & index_;
};

}  // namespace ratchet
