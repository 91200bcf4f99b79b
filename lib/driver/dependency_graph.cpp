// ratchet/driver/dependency_graph.cpp - File-level dependency graph
#include "ratchet/driver/dependency_graph.hpp"

#include <algorithm>

#include "ratchet/extractor.hpp"

namespace ratchet
{

DependencyGraph DependencyGraph::build(
  const Extractor & extractor, const std::vector<std::filesystem::path> & files)
{
  DependencyGraph graph;
  for (const auto & file : files) {
    const auto references = extractor.references_from_file(file);
    graph.add_file(extractor.relative_path(file));
    for (const auto & ref : references) {
      graph.add_reference(ref);
    }
  }
  return graph;
}

void DependencyGraph::add_file(const std::string & source) { files_.insert(source); }

void DependencyGraph::add_reference(const Reference & reference)
{
  if (!reference.constant.defining_file) {
    return;
  }
  const std::string to = reference.constant.defining_file->generic_string();
  if (to == reference.relative_path) {
    return;
  }

  add_file(reference.relative_path);
  auto key = std::make_pair(reference.relative_path, to);
  auto it = edges_.find(key);
  if (it == edges_.end()) {
    DependencyEdge edge;
    edge.from = reference.relative_path;
    edge.to = to;
    it = edges_.emplace(std::move(key), std::move(edge)).first;
  }

  DependencyEdge & edge = it->second;
  ++edge.reference_count;
  const NamespacePath & path = reference.constant.path;
  if (std::find(edge.constants.begin(), edge.constants.end(), path) == edge.constants.end()) {
    edge.constants.push_back(path);
  }
}

std::vector<std::string> DependencyGraph::files() const
{
  return {files_.begin(), files_.end()};
}

std::vector<DependencyEdge> DependencyGraph::edges() const
{
  std::vector<DependencyEdge> out;
  out.reserve(edges_.size());
  for (const auto & [_, edge] : edges_) {
    out.push_back(edge);
  }
  return out;
}

std::vector<std::string> DependencyGraph::dependencies_of(const std::string & source) const
{
  std::vector<std::string> out;
  for (auto it = edges_.lower_bound({source, std::string{}});
       it != edges_.end() && it->first.first == source; ++it) {
    out.push_back(it->first.second);
  }
  return out;
}

std::vector<std::filesystem::path> project_source_files(const NamespaceIndex & index)
{
  std::vector<std::filesystem::path> files;
  for (const auto & [path, entry] : index) {
    if (entry.file) {
      files.push_back(*entry.file);
    }
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

}  // namespace ratchet
