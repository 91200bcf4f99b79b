// ratchet/naming/namespace_path.cpp - Fully-qualified constant paths
#include "ratchet/naming/namespace_path.hpp"

namespace ratchet
{

std::optional<NamespacePath> NamespacePath::parse(std::string_view qualified)
{
  constexpr std::string_view sep = "::";

  if (qualified.substr(0, sep.size()) == sep) {
    qualified.remove_prefix(sep.size());
  }

  NamespacePath path;
  if (qualified.empty()) {
    return path;
  }

  while (true) {
    const size_t pos = qualified.find(sep);
    const std::string_view segment = qualified.substr(0, pos);
    if (segment.empty()) {
      return std::nullopt;
    }
    path.segments_.emplace_back(segment);
    if (pos == std::string_view::npos) {
      break;
    }
    qualified.remove_prefix(pos + sep.size());
  }
  return path;
}

NamespacePath NamespacePath::child(std::string segment) const
{
  NamespacePath result = *this;
  result.segments_.push_back(std::move(segment));
  return result;
}

NamespacePath NamespacePath::concat(const NamespacePath & suffix) const
{
  NamespacePath result = *this;
  result.segments_.insert(result.segments_.end(), suffix.segments_.begin(), suffix.segments_.end());
  return result;
}

std::string NamespacePath::qualified_name() const
{
  std::string out;
  for (size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) {
      out += "::";
    }
    out += segments_[i];
  }
  return out;
}

}  // namespace ratchet
