// ratchet/analysis/scope.hpp - Lexical namespace scope frames
#pragma once

#include <vector>

#include "ratchet/naming/namespace_path.hpp"
#include "ratchet/syntax/syntax_tree.hpp"

namespace ratchet
{

/**
 * One lexically enclosing namespace-opening construct.
 *
 * `segments` is what the declaration wrote (`module A::B` -> [A, B]),
 * `path` the absolute namespace it opens. The top-level frame has an empty
 * path.
 */
struct ScopeFrame
{
  const SyntaxNode * node = nullptr;
  NamespacePath segments;
  NamespacePath path;
};

/**
 * Stack of scope frames, iterated innermost-first.
 *
 * The top-level frame is always present as the outermost frame and can
 * not be popped.
 */
class ScopeStack
{
public:
  using const_iterator = std::vector<ScopeFrame>::const_reverse_iterator;

  explicit ScopeStack(const SyntaxNode * root = nullptr);

  /**
   * Open a namespace. A root-anchored declaration (`class ::A`) opens
   * exactly `segments`; otherwise the innermost path is extended.
   */
  void push(const SyntaxNode * node, NamespacePath segments, bool root_anchored);

  /// Close the innermost namespace; the top-level frame stays
  void pop();

  [[nodiscard]] const ScopeFrame & innermost() const noexcept { return frames_.back(); }
  [[nodiscard]] const ScopeFrame & top_level() const noexcept { return frames_.front(); }
  [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

  /// Innermost-first iteration
  [[nodiscard]] const_iterator begin() const noexcept { return frames_.rbegin(); }
  [[nodiscard]] const_iterator end() const noexcept { return frames_.rend(); }

  /// Absolute paths of all frames, innermost first (ends with the top level)
  [[nodiscard]] std::vector<NamespacePath> nesting() const;

private:
  std::vector<ScopeFrame> frames_;  ///< outermost first
};

}  // namespace ratchet
