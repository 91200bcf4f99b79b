// ratchet/extractor.hpp - Constant reference extraction entry point
//
// Public API for extracting references to autoloaded constants from Ruby
// code, for ad hoc snippets and for project files.
//
#pragma once

#include <gsl/span>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "ratchet/analysis/inspector.hpp"
#include "ratchet/analysis/reference.hpp"
#include "ratchet/index/namespace_index.hpp"
#include "ratchet/syntax/parser.hpp"

namespace ratchet
{

/**
 * Reported when an input is skipped because it does not parse.
 */
struct ParseFailure
{
  const std::string & relative_path;
  const ParsedUnit & unit;
};

using ParseFailureHandler = std::function<void(const ParseFailure &)>;

using InspectorList = std::vector<std::shared_ptr<const ConstantNameInspector>>;

/// The always-on inspector set: constant reads only
[[nodiscard]] InspectorList default_inspectors();

/**
 * Extracts constant references and resolves them against a NamespaceIndex.
 *
 * Work is split into two stages that can be driven separately:
 * collect_references() walks a tree and records every constant access with
 * its scope; resolve_references() binds them and keeps those that map to a
 * file inside the project.
 *
 * The extractor does not own the index. It holds no mutable state, so one
 * instance may serve concurrent calls.
 *
 * @code
 *   auto index = NamespaceIndex::scan(root, {{"app/models", {}}}, Inflector{});
 *   Extractor extractor(root, index);
 *   auto refs = extractor.references_from_string("Order.find(1)");
 * @endcode
 */
class Extractor
{
public:
  /**
   * @param root_path Project root; file paths are resolved and reported relative to it
   * @param index Namespace index to resolve against (must outlive the extractor)
   * @param inspectors Inspectors run on every node, in order
   * @param parsers Parser selection for references_from_file()
   */
  Extractor(
    std::filesystem::path root_path, const NamespaceIndex & index,
    InspectorList inspectors = default_inspectors(),
    ParserFactory parsers = ParserFactory::with_defaults());

  /// Called for each input skipped because it does not parse
  void set_parse_failure_handler(ParseFailureHandler handler)
  {
    on_parse_failure_ = std::move(handler);
  }

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Extract references from a Ruby code string, labelled "<snippet>".
   *
   * @return References to project constants in source order; empty if the snippet does not parse
   */
  [[nodiscard]] std::vector<Reference> references_from_string(std::string snippet) const;

  /**
   * Extract references from a file.
   *
   * @param file_path Path relative to the root path, or absolute
   * @return References in source order; empty if the file is missing or does not parse
   * @throws UnsupportedFileError if no parser handles the file type
   */
  [[nodiscard]] std::vector<Reference> references_from_file(
    const std::filesystem::path & file_path) const;

  // ===========================================================================
  // Stages
  // ===========================================================================

  /// Every constant access in `tree`, in source order
  [[nodiscard]] std::vector<UnresolvedReference> collect_references(
    const SyntaxTree & tree, const std::string & relative_path) const;

  /// Bind `unresolved`; references outside the project are dropped
  [[nodiscard]] std::vector<Reference> resolve_references(
    gsl::span<const UnresolvedReference> unresolved, const SourceManager & source) const;

  /// Label a file is reported under: its path relative to the root path, '/'-separated
  [[nodiscard]] std::string relative_path(const std::filesystem::path & file_path) const;

  [[nodiscard]] const std::filesystem::path & root_path() const noexcept { return root_path_; }
  [[nodiscard]] const NamespaceIndex & index() const noexcept { return index_; }

private:
  [[nodiscard]] std::filesystem::path absolute_path(const std::filesystem::path & file_path) const;

  [[nodiscard]] std::vector<Reference> extract(
    const ParsedUnit & unit, const std::string & relative_path) const;

  std::filesystem::path root_path_;
  const NamespaceIndex & index_;
  InspectorList inspectors_;
  ParserFactory parsers_;
  RubyParser snippet_parser_;
  ParseFailureHandler on_parse_failure_;
};

}  // namespace ratchet
