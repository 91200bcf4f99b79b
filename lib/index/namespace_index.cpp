// ratchet/index/namespace_index.cpp - Namespace index queries and population
#include "ratchet/index/namespace_index.hpp"

#include "ratchet/basic/errors.hpp"

namespace ratchet
{

NamespaceIndex::NamespaceIndex(std::filesystem::path project_root)
: project_root_(std::move(project_root))
{
}

// ============================================================================
// Population
// ============================================================================

NamespaceEntry & NamespaceIndex::ensure_entry(const NamespacePath & path)
{
  // Register enclosing namespaces first so every prefix is known.
  NamespacePath prefix;
  for (const auto & segment : path.segments()) {
    prefix.push_back(segment);
    auto it = entries_.find(prefix);
    if (it == entries_.end()) {
      NamespaceEntry entry;
      entry.path = prefix;
      entries_.emplace(prefix, std::move(entry));
    }
  }
  return entries_.at(path);
}

void NamespaceIndex::add_root(AutoloadRoot root)
{
  if (!root.base_namespace.empty()) {
    (void)ensure_entry(root.base_namespace);
  }
  roots_.push_back(std::move(root));
}

void NamespaceIndex::add_file(const NamespacePath & path, std::filesystem::path file)
{
  if (path.empty()) {
    return;
  }

  file = file.lexically_normal();
  NamespaceEntry & entry = ensure_entry(path);
  if (entry.file && *entry.file != file) {
    throw NamespaceCollisionError(path.qualified_name(), *entry.file, file);
  }
  entry.file = file;
  files_[file.generic_string()] = path;
}

void NamespaceIndex::add_namespace(const NamespacePath & path, bool is_directory)
{
  if (path.empty()) {
    return;
  }
  NamespaceEntry & entry = ensure_entry(path);
  entry.is_directory = entry.is_directory || is_directory;
}

// ============================================================================
// Queries
// ============================================================================

bool NamespaceIndex::is_known(const NamespacePath & path) const
{
  return entries_.count(path) > 0;
}

const NamespaceEntry * NamespaceIndex::find(const NamespacePath & path) const
{
  const auto it = entries_.find(path);
  return it == entries_.end() ? nullptr : &it->second;
}

std::optional<std::filesystem::path> NamespaceIndex::defining_file(
  const NamespacePath & path) const
{
  const NamespaceEntry * entry = find(path);
  if (entry == nullptr) {
    return std::nullopt;
  }
  return entry->file;
}

const NamespacePath * NamespaceIndex::namespace_for_file(const std::filesystem::path & file) const
{
  const auto it = files_.find(relative_to_root(file).generic_string());
  return it == files_.end() ? nullptr : &it->second;
}

bool NamespaceIndex::is_namespace_root(const std::filesystem::path & directory) const
{
  const auto wanted = relative_to_root(directory);
  for (const auto & root : roots_) {
    if (relative_to_root(root.directory) == wanted) {
      return true;
    }
  }
  return false;
}

std::filesystem::path NamespaceIndex::relative_to_root(const std::filesystem::path & p) const
{
  std::filesystem::path normal = p.lexically_normal();
  if (!normal.empty() && normal.filename().empty()) {
    normal = normal.parent_path();  // "app/models/" -> "app/models"
  }
  if (normal.is_absolute() && !project_root_.empty()) {
    return normal.lexically_relative(project_root_.lexically_normal());
  }
  return normal;
}

}  // namespace ratchet
