// ratchet/extractor.cpp - Constant reference extraction
#include "ratchet/extractor.hpp"

#include <fstream>
#include <sstream>

#include "ratchet/analysis/const_node_inspector.hpp"
#include "ratchet/analysis/constant_resolver.hpp"
#include "ratchet/analysis/ruby_grammar.hpp"
#include "ratchet/analysis/scope_walker.hpp"
#include "ratchet/basic/errors.hpp"

namespace fs = std::filesystem;

namespace ratchet
{

InspectorList default_inspectors()
{
  return {std::make_shared<const ConstNodeInspector>()};
}

Extractor::Extractor(
  fs::path root_path, const NamespaceIndex & index, InspectorList inspectors,
  ParserFactory parsers)
: root_path_(std::move(root_path)),
  index_(index),
  inspectors_(std::move(inspectors)),
  parsers_(std::move(parsers))
{
  std::error_code ec;
  const fs::path absolute = fs::absolute(root_path_, ec);
  if (!ec) {
    root_path_ = absolute.lexically_normal();
  }
}

// ============================================================================
// Entry Points
// ============================================================================

std::vector<Reference> Extractor::references_from_string(std::string snippet) const
{
  const auto unit = snippet_parser_.parse({}, std::move(snippet));
  return extract(*unit, k_snippet_label);
}

fs::path Extractor::absolute_path(const fs::path & file_path) const
{
  return (file_path.is_absolute() ? file_path : root_path_ / file_path).lexically_normal();
}

std::string Extractor::relative_path(const fs::path & file_path) const
{
  return absolute_path(file_path).lexically_relative(root_path_).generic_string();
}

std::vector<Reference> Extractor::references_from_file(const fs::path & file_path) const
{
  const fs::path full_path = absolute_path(file_path);

  std::error_code ec;
  if (!fs::exists(full_path, ec)) {
    return {};
  }

  const Parser * parser = parsers_.for_path(full_path);
  if (parser == nullptr) {
    throw UnsupportedFileError(full_path);
  }

  std::ifstream file(full_path, std::ios::binary);
  if (!file.is_open()) {
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  const auto unit = parser->parse(full_path, buffer.str());
  return extract(*unit, relative_path(full_path));
}

std::vector<Reference> Extractor::extract(
  const ParsedUnit & unit, const std::string & relative_path) const
{
  if (!unit.ok()) {
    if (on_parse_failure_) {
      on_parse_failure_(ParseFailure{relative_path, unit});
    }
    return {};
  }

  const auto unresolved = collect_references(*unit.tree, relative_path);
  return resolve_references(unresolved, unit.source);
}

// ============================================================================
// Stages
// ============================================================================

std::vector<UnresolvedReference> Extractor::collect_references(
  const SyntaxTree & tree, const std::string & relative_path) const
{
  std::vector<UnresolvedReference> out;
  if (tree.root() == nullptr) {
    return out;
  }

  const ruby::RubyNamespaceOpener opener;
  const ScopeWalker walker(opener);
  walker.walk(*tree.root(), [&](const SyntaxNode & node, const ScopeStack & scope) {
    for (const auto & inspector : inspectors_) {
      if (auto ref = inspector->inspect(node, scope, relative_path)) {
        out.push_back(std::move(*ref));
      }
    }
  });
  return out;
}

std::vector<Reference> Extractor::resolve_references(
  gsl::span<const UnresolvedReference> unresolved, const SourceManager & source) const
{
  const ConstantResolver resolver(index_);

  std::vector<Reference> out;
  for (const auto & ref : unresolved) {
    auto constant = resolver.resolve(ref);
    if (!constant) {
      continue;
    }
    out.push_back(
      Reference{ref.relative_path, source.get_full_range(ref.range), std::move(*constant)});
  }
  return out;
}

}  // namespace ratchet
