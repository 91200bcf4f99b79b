// ratchet/index/namespace_index.hpp - Namespace path <-> defining file index
//
// Maps every fully-qualified namespace path reachable through the autoload
// directories to the file expected to define it, following the directory
// naming convention (app/models/billing/invoice.rb -> Billing::Invoice).
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ratchet/naming/inflector.hpp"
#include "ratchet/naming/namespace_path.hpp"

namespace ratchet
{

// ============================================================================
// Autoload Roots
// ============================================================================

/**
 * One autoload directory.
 *
 * With an empty base namespace the directory is a plain load path whose
 * files define top-level constants; otherwise every constant below it is
 * nested in `base_namespace`.
 */
struct AutoloadRoot
{
  /// Directory, relative to the project root or absolute
  std::filesystem::path directory;

  /// Namespace the directory's contents live in (empty = top level)
  NamespacePath base_namespace;

  [[nodiscard]] bool is_namespaced() const noexcept { return !base_namespace.empty(); }
};

/**
 * Options for NamespaceIndex::scan().
 *
 * Paths are relative to the project root or absolute.
 */
struct ScanOptions
{
  /// Directories that do not introduce a namespace segment
  std::vector<std::filesystem::path> collapse;

  /// Files and directories that are skipped entirely
  std::vector<std::filesystem::path> ignore;

  /// Extensions of files that define constants
  std::vector<std::string> extensions = {".rb"};
};

// ============================================================================
// NamespaceEntry
// ============================================================================

struct NamespaceEntry
{
  NamespacePath path;

  /// Defining file, relative to the project root; none for a pure namespace
  std::optional<std::filesystem::path> file;

  /// A directory named after this namespace exists in some autoload root
  bool is_directory = false;

  [[nodiscard]] bool has_file() const noexcept { return file.has_value(); }
};

// ============================================================================
// NamespaceIndex
// ============================================================================

/**
 * Read-only (after construction) lookup table from namespace paths to
 * entries.
 *
 * Every prefix of a registered path is itself registered, so `is_known`
 * answers "does this namespace exist at all" for any intermediate module.
 * The index holds no references to external state and may be shared between
 * threads as long as nobody mutates it.
 */
class NamespaceIndex
{
public:
  using EntryMap = std::map<NamespacePath, NamespaceEntry>;

  explicit NamespaceIndex(std::filesystem::path project_root = {});

  /**
   * Build an index by scanning autoload directories.
   *
   * Directories are visited in sorted order. Hidden entries, ignored paths
   * and subdirectories that are themselves autoload roots are skipped. A
   * root directory that does not exist contributes nothing.
   *
   * @throws NamespaceCollisionError if two files map to the same namespace path
   */
  [[nodiscard]] static NamespaceIndex scan(
    const std::filesystem::path & project_root, const std::vector<AutoloadRoot> & roots,
    const Inflector & inflector, const ScanOptions & options = {});

  // ===========================================================================
  // Population
  // ===========================================================================

  /// Record an autoload root and register its base namespace
  void add_root(AutoloadRoot root);

  /**
   * Register `file` (relative to the project root) as the definition of `path`.
   *
   * @throws NamespaceCollisionError if `path` already has a different file
   */
  void add_file(const NamespacePath & path, std::filesystem::path file);

  /// Register `path` as a namespace; `is_directory` marks a backing directory
  void add_namespace(const NamespacePath & path, bool is_directory = false);

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// True if `path` names a known namespace or constant
  [[nodiscard]] bool is_known(const NamespacePath & path) const;

  [[nodiscard]] const NamespaceEntry * find(const NamespacePath & path) const;

  /// Defining file of exactly `path`, if any
  [[nodiscard]] std::optional<std::filesystem::path> defining_file(
    const NamespacePath & path) const;

  /// Namespace path defined by `file` (relative to the project root), if any
  [[nodiscard]] const NamespacePath * namespace_for_file(const std::filesystem::path & file) const;

  /// True if `directory` is one of the configured autoload roots
  [[nodiscard]] bool is_namespace_root(const std::filesystem::path & directory) const;

  [[nodiscard]] const std::filesystem::path & project_root() const noexcept
  {
    return project_root_;
  }
  [[nodiscard]] const std::vector<AutoloadRoot> & roots() const noexcept { return roots_; }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  /// Entries in namespace path order
  [[nodiscard]] EntryMap::const_iterator begin() const { return entries_.begin(); }
  [[nodiscard]] EntryMap::const_iterator end() const { return entries_.end(); }

private:
  NamespaceEntry & ensure_entry(const NamespacePath & path);

  [[nodiscard]] std::filesystem::path relative_to_root(const std::filesystem::path & p) const;

  std::filesystem::path project_root_;
  std::vector<AutoloadRoot> roots_;
  EntryMap entries_;
  std::map<std::string, NamespacePath> files_;  ///< generic relative path -> namespace
};

}  // namespace ratchet
