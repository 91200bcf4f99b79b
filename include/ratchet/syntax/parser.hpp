// ratchet/syntax/parser.hpp - Pluggable per-file-type parsers
//
// Parsers turn raw text into a SyntaxTree. Which parser handles a file is
// decided by ParserFactory from the file's extension or name.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ratchet/syntax/syntax_tree.hpp"

namespace ratchet
{

// ============================================================================
// Parser
// ============================================================================

class Parser
{
public:
  virtual ~Parser() = default;

  /**
   * Parse `source_text`.
   *
   * Never returns null. The returned unit's tree is null when the text does
   * not parse; the reasons are recorded in the unit's diagnostics.
   *
   * @param path File the text came from (may be empty for snippets)
   * @param source_text Source text
   */
  [[nodiscard]] virtual std::unique_ptr<ParsedUnit> parse(
    std::filesystem::path path, std::string source_text) const = 0;
};

// ============================================================================
// RubyParser
// ============================================================================

/**
 * Ruby parser backed by tree-sitter-ruby.
 *
 * Any ERROR or MISSING node in the concrete tree makes the whole input
 * unparseable; each one is reported as a diagnostic (up to a fixed cap).
 */
class RubyParser final : public Parser
{
public:
  [[nodiscard]] std::unique_ptr<ParsedUnit> parse(
    std::filesystem::path path, std::string source_text) const override;
};

// ============================================================================
// ParserFactory
// ============================================================================

/**
 * Registry mapping file extensions (".rb") and exact file names ("Gemfile")
 * to parsers.
 */
class ParserFactory
{
public:
  /// Empty factory; see with_defaults() for the standard registrations
  ParserFactory() = default;

  /// Factory with RubyParser registered for .rb, .rake, .ru, .gemspec, Gemfile, Rakefile
  [[nodiscard]] static ParserFactory with_defaults();

  /// Register `parser` for each extension (with leading dot) in `extensions`
  void register_extensions(
    const std::vector<std::string> & extensions, std::shared_ptr<const Parser> parser);

  /// Register `parser` for files whose name is exactly one of `file_names`
  void register_file_names(
    const std::vector<std::string> & file_names, std::shared_ptr<const Parser> parser);

  /// Parser responsible for `path`, or nullptr when the file type is unsupported
  [[nodiscard]] const Parser * for_path(const std::filesystem::path & path) const;

private:
  std::unordered_map<std::string, std::shared_ptr<const Parser>> by_extension_;
  std::unordered_map<std::string, std::shared_ptr<const Parser>> by_file_name_;
};

}  // namespace ratchet
