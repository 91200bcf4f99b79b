// ratchet/syntax/ruby_parser.cpp - tree-sitter-ruby front end
#include "ratchet/syntax/parser.hpp"
#include "ratchet/syntax/ts_ll.hpp"

namespace ratchet
{

namespace
{

void collect_syntax_diagnostics(const ts_ll::Node n, DiagnosticBag & diags, size_t & count)
{
  constexpr size_t max_syntax_diags = 64;
  if (count >= max_syntax_diags) return;
  if (n.is_null()) return;

  if (n.is_error()) {
    diags.report_error(n.range(), "Syntax error").with_code(diag_codes::k_syntax_error);
    ++count;
  } else if (n.is_missing()) {
    diags.report_error(n.range(), "Missing token").with_code(diag_codes::k_missing_token);
    ++count;
  }

  if (count >= max_syntax_diags) return;

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    collect_syntax_diagnostics(n.child(i), diags, count);
    if (count >= max_syntax_diags) return;
  }
}

// Copies the named nodes below `cursor`'s current node into `tree`.
// Anonymous tokens (keywords, punctuation) are dropped; the field a node
// occupies in its parent is kept.
void copy_named_children(ts_ll::Cursor & cursor, SyntaxTree & tree, SyntaxNode * parent)
{
  if (!cursor.goto_first_child()) {
    return;
  }
  do {
    const ts_ll::Node n = cursor.current_node();
    if (n.is_named()) {
      SyntaxNode * node = tree.add_node(n.kind(), cursor.current_field_name(), n.range(), parent);
      copy_named_children(cursor, tree, node);
    }
  } while (cursor.goto_next_sibling());
  (void)cursor.goto_parent();
}

}  // namespace

std::unique_ptr<ParsedUnit> RubyParser::parse(
  std::filesystem::path path, std::string source_text) const
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(std::move(path), std::move(source_text));

  const ts_ll::Parser parser;
  const ts_ll::Tree ts_tree(parser.parse_string(unit->source.get_source()));

  if (ts_tree.is_null()) {
    unit->diags.report_error({}, "tree-sitter parse failed (null tree)")
      .with_code(diag_codes::k_syntax_error);
    return unit;
  }

  const ts_ll::Node root = ts_tree.root_node();

  // Tree-sitter recovers from syntax errors and still returns a tree; a
  // recovered tree is not trusted for constant lookup.
  if (root.has_error()) {
    size_t count = 0;
    collect_syntax_diagnostics(root, unit->diags, count);
    return unit;
  }

  auto tree = std::make_unique<SyntaxTree>(unit->source);
  SyntaxNode * root_node = tree->add_node(root.kind(), {}, root.range(), nullptr);
  ts_ll::Cursor cursor(root);
  copy_named_children(cursor, *tree, root_node);
  unit->tree = std::move(tree);
  return unit;
}

}  // namespace ratchet
