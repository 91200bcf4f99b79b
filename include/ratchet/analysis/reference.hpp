// ratchet/analysis/reference.hpp - Resolved constant references
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "ratchet/basic/source_manager.hpp"
#include "ratchet/naming/namespace_path.hpp"

namespace ratchet
{

/**
 * Resolved identity of a constant. Equality is by fully-qualified path.
 */
struct ConstantContext
{
  NamespacePath path;

  /// Defining file relative to the project root, if the constant has one
  std::optional<std::filesystem::path> defining_file;

  [[nodiscard]] std::string name() const { return path.qualified_name(); }

  [[nodiscard]] bool operator==(const ConstantContext & other) const noexcept
  {
    return path == other.path;
  }
  [[nodiscard]] bool operator!=(const ConstantContext & other) const noexcept
  {
    return path != other.path;
  }
};

/**
 * "This location in `relative_path` references `constant`."
 */
struct Reference
{
  /// Source file relative to the project root, or "<snippet>"
  std::string relative_path;
  FullSourceRange location;
  ConstantContext constant;

  [[nodiscard]] bool operator==(const Reference & other) const noexcept
  {
    return relative_path == other.relative_path && location == other.location &&
           constant == other.constant && constant.defining_file == other.constant.defining_file;
  }
  [[nodiscard]] bool operator!=(const Reference & other) const noexcept
  {
    return !(*this == other);
  }
};

inline constexpr const char * k_snippet_label = "<snippet>";

}  // namespace ratchet
