// ratchet/index/directory_scan.cpp - Build a NamespaceIndex from autoload directories
#include <algorithm>
#include <set>

#include "ratchet/index/namespace_index.hpp"

namespace fs = std::filesystem;

namespace ratchet
{

namespace
{

fs::path normalize(const fs::path & path)
{
  try {
    return fs::weakly_canonical(path);
  } catch (const fs::filesystem_error &) {
    return path.lexically_normal();
  }
}

fs::path absolute_under(const fs::path & project_root, const fs::path & p)
{
  return normalize(p.is_absolute() ? p : project_root / p);
}

class DirectoryScanner
{
public:
  DirectoryScanner(
    NamespaceIndex & index, fs::path project_root, const Inflector & inflector,
    const ScanOptions & options)
  : index_(index), project_root_(std::move(project_root)), inflector_(inflector), options_(options)
  {
    for (const auto & p : options.collapse) {
      collapse_.insert(absolute_under(project_root_, p));
    }
    for (const auto & p : options.ignore) {
      ignore_.insert(absolute_under(project_root_, p));
    }
  }

  void add_root_directory(const fs::path & dir) { root_dirs_.insert(dir); }

  void scan_directory(const fs::path & dir, const NamespacePath & ns)
  {
    // A symlink back to an enclosing directory would otherwise recurse forever.
    if (!active_.insert(dir).second) {
      return;
    }
    scan_entries(dir, ns);
    active_.erase(dir);
  }

private:
  void scan_entries(const fs::path & dir, const NamespacePath & ns)
  {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(), [](const auto & a, const auto & b) {
      return a.path().filename() < b.path().filename();
    });

    for (const auto & entry : entries) {
      const std::string name = entry.path().filename().string();
      if (name.empty() || name.front() == '.') {
        continue;
      }

      const fs::path abs = normalize(entry.path());
      if (ignore_.count(abs) > 0) {
        continue;
      }

      if (entry.is_directory(ec)) {
        // Nested roots are scanned on their own, with their own namespace.
        if (root_dirs_.count(abs) > 0) {
          continue;
        }
        if (active_.count(abs) > 0) {
          continue;
        }
        if (collapse_.count(abs) > 0) {
          scan_directory(abs, ns);
          continue;
        }
        std::string segment = inflector_.camelize(name);
        if (segment.empty()) {
          continue;
        }
        const NamespacePath child = ns.child(std::move(segment));
        index_.add_namespace(child, /*is_directory*/ true);
        scan_directory(abs, child);
      } else if (entry.is_regular_file(ec) && is_source_file(entry.path())) {
        // `_.rb` names no constant.
        std::string segment = inflector_.camelize(entry.path().stem().string());
        if (segment.empty()) {
          continue;
        }
        index_.add_file(ns.child(std::move(segment)), abs.lexically_relative(project_root_));
      }
    }
  }

  [[nodiscard]] bool is_source_file(const fs::path & path) const
  {
    const std::string ext = path.extension().string();
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) !=
           options_.extensions.end();
  }

  NamespaceIndex & index_;
  fs::path project_root_;
  const Inflector & inflector_;
  const ScanOptions & options_;
  std::set<fs::path> collapse_;
  std::set<fs::path> ignore_;
  std::set<fs::path> root_dirs_;
  std::set<fs::path> active_;  ///< directories on the current descent
};

}  // namespace

NamespaceIndex NamespaceIndex::scan(
  const fs::path & project_root, const std::vector<AutoloadRoot> & roots,
  const Inflector & inflector, const ScanOptions & options)
{
  const fs::path root = normalize(fs::absolute(project_root));
  NamespaceIndex index(root);
  DirectoryScanner scanner(index, root, inflector, options);

  std::vector<fs::path> root_dirs;
  root_dirs.reserve(roots.size());
  for (const auto & r : roots) {
    root_dirs.push_back(absolute_under(root, r.directory));
    scanner.add_root_directory(root_dirs.back());
    index.add_root(r);
  }

  for (size_t i = 0; i < roots.size(); ++i) {
    std::error_code ec;
    if (!fs::is_directory(root_dirs[i], ec)) {
      continue;
    }
    scanner.scan_directory(root_dirs[i], roots[i].base_namespace);
  }

  return index;
}

}  // namespace ratchet
