// ratchet/syntax/syntax_tree.hpp - Parser-independent syntax tree
//
// A uniform node shape (kind, field, children, range) that insulates the
// analysis from whichever concrete parser produced it. Trees are immutable
// once built and own all of their nodes.
//
#pragma once

#include <gsl/span>

#include <deque>
#include <memory>
#include <string_view>
#include <vector>

#include "ratchet/basic/diagnostic.hpp"
#include "ratchet/basic/source_manager.hpp"

namespace ratchet
{

class SyntaxTree;

// ============================================================================
// SyntaxNode
// ============================================================================

/**
 * A single named node of a parsed source file.
 *
 * `kind()` is the grammar's node type (e.g. "constant", "scope_resolution"),
 * `field()` the name of the slot this node occupies in its parent (e.g.
 * "name", "superclass"), or empty when the parent does not name it.
 */
class SyntaxNode
{
public:
  SyntaxNode(std::string_view kind, std::string_view field, SourceRange range)
  : kind_(kind), field_(field), range_(range)
  {
  }

  SyntaxNode(const SyntaxNode &) = delete;
  SyntaxNode & operator=(const SyntaxNode &) = delete;

  [[nodiscard]] std::string_view kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view field() const noexcept { return field_; }
  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }

  [[nodiscard]] const SyntaxNode * parent() const noexcept { return parent_; }

  [[nodiscard]] gsl::span<const SyntaxNode * const> children() const noexcept
  {
    return {children_.data(), children_.size()};
  }

  /// First child stored under `field`, or nullptr
  [[nodiscard]] const SyntaxNode * child_by_field(std::string_view field) const noexcept;

  [[nodiscard]] bool is(std::string_view kind) const noexcept { return kind_ == kind; }

private:
  friend class SyntaxTree;

  std::string_view kind_;
  std::string_view field_;
  SourceRange range_;
  std::string_view text_;
  const SyntaxNode * parent_ = nullptr;
  std::vector<const SyntaxNode *> children_;
};

// ============================================================================
// SyntaxTree
// ============================================================================

/**
 * Owner of a node arena plus the root node.
 *
 * Node kinds and field names are borrowed: they must outlive the tree
 * (grammar tables and string literals do). Node text is a slice of the
 * SourceManager passed at construction, which must outlive the tree too.
 */
class SyntaxTree
{
public:
  explicit SyntaxTree(const SourceManager & source) : source_(source) {}

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;

  /**
   * Append a node. With a null parent the node becomes the root; otherwise
   * it is appended as the last child of `parent`.
   */
  SyntaxNode * add_node(
    std::string_view kind, std::string_view field, SourceRange range, SyntaxNode * parent);

  [[nodiscard]] const SyntaxNode * root() const noexcept { return root_; }
  [[nodiscard]] const SourceManager & source() const noexcept { return source_; }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }

private:
  const SourceManager & source_;
  std::deque<SyntaxNode> nodes_;
  SyntaxNode * root_ = nullptr;
};

// ============================================================================
// ParsedUnit
// ============================================================================

/**
 * Result of parsing one input: the source, any syntax diagnostics, and the
 * tree. `tree` is null when the input could not be parsed.
 */
struct ParsedUnit
{
  SourceManager source;
  DiagnosticBag diags;
  std::unique_ptr<SyntaxTree> tree;

  [[nodiscard]] bool ok() const noexcept { return tree != nullptr; }
};

}  // namespace ratchet
