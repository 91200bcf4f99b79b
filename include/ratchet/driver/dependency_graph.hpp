// ratchet/driver/dependency_graph.hpp - File-level dependency graph
//
// Aggregates constant references over a set of project files into edges
// "source file depends on defining file".
//
#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ratchet/analysis/reference.hpp"
#include "ratchet/index/namespace_index.hpp"

namespace ratchet
{

class Extractor;

// ============================================================================
// DependencyEdge
// ============================================================================

struct DependencyEdge
{
  /// Referencing file, relative to the project root
  std::string from;

  /// Defining file, relative to the project root
  std::string to;

  /// Number of references along this edge
  size_t reference_count = 0;

  /// Distinct constants referenced, in order of first reference
  std::vector<NamespacePath> constants;
};

// ============================================================================
// DependencyGraph
// ============================================================================

class DependencyGraph
{
public:
  /**
   * Extract references from each of `files` and aggregate them.
   *
   * @throws UnsupportedFileError if a file has no parser
   */
  [[nodiscard]] static DependencyGraph build(
    const Extractor & extractor, const std::vector<std::filesystem::path> & files);

  /// Record that `source` was analyzed (it becomes a node even without edges)
  void add_file(const std::string & source);

  /// Add one reference; references to a constant defined in the same file are ignored
  void add_reference(const Reference & reference);

  /// Analyzed files, sorted
  [[nodiscard]] std::vector<std::string> files() const;

  /// Edges sorted by (from, to)
  [[nodiscard]] std::vector<DependencyEdge> edges() const;

  /// Defining files `source` depends on, sorted
  [[nodiscard]] std::vector<std::string> dependencies_of(const std::string & source) const;

  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

private:
  std::set<std::string> files_;
  std::map<std::pair<std::string, std::string>, DependencyEdge> edges_;
};

/// Every file the index maps to a namespace, relative to the project root, sorted
[[nodiscard]] std::vector<std::filesystem::path> project_source_files(const NamespaceIndex & index);

}  // namespace ratchet
