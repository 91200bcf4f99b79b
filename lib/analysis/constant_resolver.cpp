// ratchet/analysis/constant_resolver.cpp - Constant lookup simulation
#include "ratchet/analysis/constant_resolver.hpp"

namespace ratchet
{

std::optional<NamespacePath> ConstantResolver::resolve_path(
  const ConstantName & name, const ScopeStack & scope) const
{
  if (name.segments.empty()) {
    return std::nullopt;
  }

  NamespacePath candidate;
  if (name.root_anchored) {
    candidate = name.segments;
  } else {
    const std::string & first = name.segments.front();
    std::optional<NamespacePath> base;
    for (const ScopeFrame & frame : scope) {
      if (index_.is_known(frame.path.child(first))) {
        base = frame.path;
        break;
      }
    }
    if (!base) {
      return std::nullopt;
    }
    candidate = base->concat(name.segments);
  }

  if (!index_.is_known(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

std::optional<ConstantContext> ConstantResolver::resolve(const UnresolvedReference & ref) const
{
  auto path = resolve_path(ref.name, ref.scope);
  if (!path) {
    return std::nullopt;
  }

  auto file = index_.defining_file(*path);
  if (!file) {
    return std::nullopt;
  }
  return ConstantContext{std::move(*path), std::move(file)};
}

}  // namespace ratchet
