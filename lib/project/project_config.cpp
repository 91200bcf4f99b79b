// ratchet/project/project_config.cpp - Project configuration implementation
//
#include "ratchet/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <stdexcept>

#include "ratchet/analysis/association_inspector.hpp"
#include "ratchet/analysis/const_node_inspector.hpp"

namespace ratchet
{

namespace
{

constexpr const char * k_inspector_constants = "constants";
constexpr const char * k_inspector_associations = "associations";

/// Namespace written in the config, parsed; nullopt unless every segment is a constant name
std::optional<NamespacePath> parse_namespace(const std::string & text)
{
  auto path = NamespacePath::parse(text);
  if (!path) {
    return std::nullopt;
  }
  for (const auto & segment : path->segments()) {
    if (!std::isupper(static_cast<unsigned char>(segment.front()))) {
      return std::nullopt;
    }
  }
  return path;
}

/// Parse a single autoload path entry
std::optional<AutoloadPathConfig> parse_autoload_path(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "autoload path entry must be a map";
    return std::nullopt;
  }
  if (!node["path"] || !node["path"].IsScalar()) {
    error = "autoload path entry must have a 'path'";
    return std::nullopt;
  }

  AutoloadPathConfig entry;
  entry.path = node["path"].as<std::string>();

  if (node["namespace"]) {
    const auto ns = node["namespace"].as<std::string>();
    if (!parse_namespace(ns)) {
      error = "invalid namespace '" + ns + "' for '" + entry.path.generic_string() + "'";
      return std::nullopt;
    }
    entry.namespace_name = ns;
  }

  return entry;
}

/// Read a list of paths; returns false if `node` is not a list
bool parse_path_list(const YAML::Node & node, std::vector<std::filesystem::path> & out)
{
  if (!node.IsSequence()) {
    return false;
  }
  for (const auto & item : node) {
    out.emplace_back(item.as<std::string>());
  }
  return true;
}

/// Read a string -> string map; returns false if `node` is not a map
bool parse_string_map(const YAML::Node & node, std::map<std::string, std::string> & out)
{
  if (!node.IsMap()) {
    return false;
  }
  for (const auto & item : node) {
    out[item.first.as<std::string>()] = item.second.as<std::string>();
  }
  return true;
}

ConfigLoadResult parse_document(const YAML::Node & root, const std::filesystem::path & base_dir)
{
  namespace fs = std::filesystem;

  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  ProjectConfig config;
  config.inspectors.clear();

  // Parse 'root'
  fs::path project_root = base_dir;
  if (root["root"]) {
    project_root = base_dir / root["root"].as<std::string>();
  }
  config.project_root = fs::absolute(project_root).lexically_normal();
  if (!config.project_root.has_filename()) {
    config.project_root = config.project_root.parent_path();
  }

  // Parse 'autoload_paths' section
  const auto & paths = root["autoload_paths"];
  if (!paths) {
    return ConfigLoadResult::fail("autoload_paths is required");
  }
  if (!paths.IsSequence() || paths.size() == 0) {
    return ConfigLoadResult::fail("autoload_paths must be a non-empty list");
  }
  for (const auto & path_node : paths) {
    std::string path_error;
    auto entry = parse_autoload_path(path_node, path_error);
    if (!entry) {
      return ConfigLoadResult::fail("invalid autoload path: " + path_error);
    }
    config.autoload_paths.push_back(std::move(*entry));
  }

  if (root["collapse"] && !parse_path_list(root["collapse"], config.collapse)) {
    return ConfigLoadResult::fail("collapse must be a list");
  }
  if (root["ignore"] && !parse_path_list(root["ignore"], config.ignore)) {
    return ConfigLoadResult::fail("ignore must be a list");
  }

  // Parse 'inflections' section
  if (const auto & infl = root["inflections"]) {
    if (!infl.IsMap()) {
      return ConfigLoadResult::fail("inflections must be a map");
    }
    if (infl["acronyms"]) {
      if (!infl["acronyms"].IsSequence()) {
        return ConfigLoadResult::fail("inflections.acronyms must be a list");
      }
      for (const auto & acronym : infl["acronyms"]) {
        config.inflections.acronyms.push_back(acronym.as<std::string>());
      }
    }
    if (infl["overrides"] && !parse_string_map(infl["overrides"], config.inflections.overrides)) {
      return ConfigLoadResult::fail("inflections.overrides must be a map");
    }
    if (infl["irregular"] && !parse_string_map(infl["irregular"], config.inflections.irregular)) {
      return ConfigLoadResult::fail("inflections.irregular must be a map");
    }
  }

  // Parse 'inspectors' section
  if (const auto & inspectors = root["inspectors"]) {
    if (!inspectors.IsSequence()) {
      return ConfigLoadResult::fail("inspectors must be a list");
    }
    for (const auto & item : inspectors) {
      const auto name = item.as<std::string>();
      if (name != k_inspector_constants && name != k_inspector_associations) {
        return ConfigLoadResult::fail(
          "invalid inspector: '" + name + "' (must be 'constants' or 'associations')");
      }
      config.inspectors.push_back(name);
    }
  } else {
    config.inspectors.emplace_back(k_inspector_constants);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_document(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & base_dir)
{
  try {
    return parse_document(YAML::Load(yaml_text), base_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

ProjectConfig default_project_config(const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = std::filesystem::absolute(project_root).lexically_normal();
  for (const char * dir :
       {"app/channels", "app/controllers", "app/controllers/concerns", "app/helpers", "app/jobs",
        "app/mailers", "app/models", "app/models/concerns", "app/services", "lib"}) {
    config.autoload_paths.push_back(AutoloadPathConfig{dir, std::nullopt});
  }
  return config;
}

// ============================================================================
// Derived Objects
// ============================================================================

Inflector make_inflector(const ProjectConfig & config)
{
  Inflector inflector;
  for (const auto & acronym : config.inflections.acronyms) {
    inflector.add_acronym(acronym);
  }
  for (const auto & [basename, constant] : config.inflections.overrides) {
    inflector.add_override(basename, constant);
  }
  for (const auto & [singular, plural] : config.inflections.irregular) {
    inflector.add_irregular(singular, plural);
  }
  return inflector;
}

std::vector<AutoloadRoot> make_autoload_roots(const ProjectConfig & config)
{
  std::vector<AutoloadRoot> roots;
  roots.reserve(config.autoload_paths.size());
  for (const auto & entry : config.autoload_paths) {
    AutoloadRoot root;
    root.directory = entry.path;
    if (entry.namespace_name) {
      auto ns = parse_namespace(*entry.namespace_name);
      if (!ns) {
        throw std::invalid_argument("invalid namespace: " + *entry.namespace_name);
      }
      root.base_namespace = std::move(*ns);
    }
    roots.push_back(std::move(root));
  }
  return roots;
}

ScanOptions make_scan_options(const ProjectConfig & config)
{
  ScanOptions options;
  options.collapse = config.collapse;
  options.ignore = config.ignore;
  return options;
}

InspectorList make_inspectors(const ProjectConfig & config)
{
  InspectorList inspectors;
  for (const auto & name : config.inspectors) {
    if (name == k_inspector_constants) {
      inspectors.push_back(std::make_shared<const ConstNodeInspector>());
    } else if (name == k_inspector_associations) {
      inspectors.push_back(std::make_shared<const AssociationInspector>(make_inflector(config)));
    } else {
      throw std::invalid_argument("unknown inspector: " + name);
    }
  }
  return inspectors;
}

}  // namespace ratchet
