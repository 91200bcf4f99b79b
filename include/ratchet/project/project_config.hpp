// ratchet/project/project_config.hpp - Project configuration (ratchet.yml)
//
// Parses and validates ratchet.yml, which describes the autoload layout of a
// project: which directories map to which namespaces, and how file names
// are inflected into constant names.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ratchet/extractor.hpp"
#include "ratchet/index/namespace_index.hpp"
#include "ratchet/naming/inflector.hpp"

namespace ratchet
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * One entry of `autoload_paths`.
 */
struct AutoloadPathConfig
{
  /// Directory (relative to the project root)
  std::filesystem::path path;

  /// Namespace the directory's contents live in, e.g. "Acme::Billing"
  std::optional<std::string> namespace_name;
};

/**
 * `inflections` section.
 */
struct InflectionConfig
{
  std::vector<std::string> acronyms;

  /// Basename -> constant name
  std::map<std::string, std::string> overrides;

  /// Singular -> plural
  std::map<std::string, std::string> irregular;
};

/**
 * Complete project configuration (ratchet.yml).
 */
struct ProjectConfig
{
  /// Absolute project root (`root`, resolved against the config file's directory)
  std::filesystem::path project_root;

  std::vector<AutoloadPathConfig> autoload_paths;
  std::vector<std::filesystem::path> collapse;
  std::vector<std::filesystem::path> ignore;
  InflectionConfig inflections;

  /// Enabled inspectors: "constants", "associations"
  std::vector<std::string> inspectors = {"constants"};
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a ratchet.yml file.
 *
 * @param config_path Path to ratchet.yml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse ratchet.yml contents.
 *
 * @param yaml_text Configuration text
 * @param base_dir Directory `root` is resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & base_dir);

/**
 * Find ratchet.yml by searching upward from `start_dir` to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Configuration used when a project has no ratchet.yml: the conventional
 * Rails application directories and `lib`, all at the top level.
 */
[[nodiscard]] ProjectConfig default_project_config(const std::filesystem::path & project_root);

inline constexpr const char * k_project_config_file_name = "ratchet.yml";

// ============================================================================
// Derived Objects
// ============================================================================

/// Inflector with the configured acronyms, overrides and irregular plurals
[[nodiscard]] Inflector make_inflector(const ProjectConfig & config);

[[nodiscard]] std::vector<AutoloadRoot> make_autoload_roots(const ProjectConfig & config);

[[nodiscard]] ScanOptions make_scan_options(const ProjectConfig & config);

/// Inspectors named in `config.inspectors`, in the configured order
[[nodiscard]] InspectorList make_inspectors(const ProjectConfig & config);

}  // namespace ratchet
