// ratchet/basic/errors.hpp - Hard failures surfaced to callers
//
// Problems in the analyzed code are diagnostics; these exceptions are for a
// misconfigured tool (ambiguous autoload layout, input no parser accepts).
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ratchet
{

/// No parser is registered for the file's extension or name.
class UnsupportedFileError : public std::runtime_error
{
public:
  explicit UnsupportedFileError(const std::filesystem::path & path)
  : std::runtime_error("Unsupported file type: " + path.string()), path_(path)
  {
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/// Two files map to the same fully-qualified namespace path.
class NamespaceCollisionError : public std::runtime_error
{
public:
  NamespaceCollisionError(
    std::string qualified_name, std::filesystem::path existing, std::filesystem::path incoming)
  : std::runtime_error(
      "namespace '" + qualified_name + "' is defined by both '" + existing.string() + "' and '" +
      incoming.string() + "'"),
    qualified_name_(std::move(qualified_name)),
    existing_(std::move(existing)),
    incoming_(std::move(incoming))
  {
  }

  [[nodiscard]] const std::string & qualified_name() const noexcept { return qualified_name_; }
  [[nodiscard]] const std::filesystem::path & existing_file() const noexcept { return existing_; }
  [[nodiscard]] const std::filesystem::path & incoming_file() const noexcept { return incoming_; }

private:
  std::string qualified_name_;
  std::filesystem::path existing_;
  std::filesystem::path incoming_;
};

}  // namespace ratchet
