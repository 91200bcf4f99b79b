// tests/unit/project/test_project_config.cpp - Unit tests for ratchet.yml loading

#include <gtest/gtest.h>

#include <filesystem>

#include "../support/fixture_project.hpp"
#include "ratchet/project/project_config.hpp"

using namespace ratchet;
using ratchet::testing::FixtureProject;

namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(ProjectConfig, ParsesFullConfiguration)
{
  const auto result = parse_project_config(
    "root: .\n"
    "autoload_paths:\n"
    "  - path: app/models\n"
    "  - path: lib\n"
    "    namespace: Acme::Tools\n"
    "collapse: [app/models/shared]\n"
    "ignore:\n"
    "  - lib/tasks\n"
    "inflections:\n"
    "  acronyms: [HTML, API]\n"
    "  overrides: { ssl_error: SSLError }\n"
    "  irregular: { criterion: criteria }\n"
    "inspectors: [constants, associations]\n",
    "/work/shop");

  ASSERT_TRUE(result.success) << result.error;
  const auto & config = result.config;
  EXPECT_EQ(config.project_root, fs::path("/work/shop"));

  ASSERT_EQ(config.autoload_paths.size(), 2U);
  EXPECT_EQ(config.autoload_paths[0].path, fs::path("app/models"));
  EXPECT_FALSE(config.autoload_paths[0].namespace_name.has_value());
  EXPECT_EQ(config.autoload_paths[1].namespace_name, std::string("Acme::Tools"));

  ASSERT_EQ(config.collapse.size(), 1U);
  EXPECT_EQ(config.collapse[0], fs::path("app/models/shared"));
  ASSERT_EQ(config.ignore.size(), 1U);
  EXPECT_EQ(config.ignore[0], fs::path("lib/tasks"));

  EXPECT_EQ(config.inflections.acronyms, (std::vector<std::string>{"HTML", "API"}));
  EXPECT_EQ(config.inflections.overrides.at("ssl_error"), "SSLError");
  EXPECT_EQ(config.inflections.irregular.at("criterion"), "criteria");
  EXPECT_EQ(config.inspectors, (std::vector<std::string>{"constants", "associations"}));
}

TEST(ProjectConfig, DefaultsToConstantsInspectorAndConfigDirectory)
{
  const auto result = parse_project_config(
    "autoload_paths:\n"
    "  - path: app/models\n",
    "/work/shop");

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::path("/work/shop"));
  EXPECT_EQ(result.config.inspectors, (std::vector<std::string>{"constants"}));
  EXPECT_TRUE(result.config.collapse.empty());
}

TEST(ProjectConfig, RootIsRelativeToConfigDirectory)
{
  const auto result = parse_project_config(
    "root: ../app_root\n"
    "autoload_paths:\n"
    "  - path: lib\n",
    "/work/config");

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, fs::path("/work/app_root"));
}

// ============================================================================
// Validation
// ============================================================================

TEST(ProjectConfig, RejectsMissingOrEmptyAutoloadPaths)
{
  EXPECT_FALSE(parse_project_config("root: .\n", "/work").success);
  EXPECT_FALSE(parse_project_config("autoload_paths: []\n", "/work").success);
  EXPECT_FALSE(parse_project_config("autoload_paths: app/models\n", "/work").success);
  EXPECT_FALSE(parse_project_config("", "/work").success);
}

TEST(ProjectConfig, RejectsMalformedEntries)
{
  const auto no_path = parse_project_config(
    "autoload_paths:\n"
    "  - namespace: Acme\n",
    "/work");
  EXPECT_FALSE(no_path.success);
  EXPECT_NE(no_path.error.find("path"), std::string::npos);

  const auto bad_namespace = parse_project_config(
    "autoload_paths:\n"
    "  - path: lib\n"
    "    namespace: acme::tools\n",
    "/work");
  EXPECT_FALSE(bad_namespace.success);

  const auto bad_inspector = parse_project_config(
    "autoload_paths:\n"
    "  - path: lib\n"
    "inspectors: [constants, routes]\n",
    "/work");
  EXPECT_FALSE(bad_inspector.success);
  EXPECT_NE(bad_inspector.error.find("routes"), std::string::npos);

  const auto bad_collapse = parse_project_config(
    "autoload_paths:\n"
    "  - path: lib\n"
    "collapse: lib/shared\n",
    "/work");
  EXPECT_FALSE(bad_collapse.success);
}

TEST(ProjectConfig, ReportsYamlSyntaxErrors)
{
  const auto result = parse_project_config("autoload_paths: [app/models\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error.empty());
}

// ============================================================================
// Files
// ============================================================================

TEST(ProjectConfig, LoadsAndFindsConfigFile)
{
  FixtureProject project;
  project.write_file(
    "ratchet.yml",
    "autoload_paths:\n"
    "  - path: app/models\n");
  const auto nested = project.make_dir("app/models/billing");

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), fs::path(k_project_config_file_name));

  const auto result = load_project_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(
    fs::weakly_canonical(result.config.project_root), fs::weakly_canonical(project.root()));
}

TEST(ProjectConfig, MissingFileFails)
{
  FixtureProject project;
  const auto result = load_project_config(project.root() / "ratchet.yml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

// ============================================================================
// Derived Objects
// ============================================================================

TEST(ProjectConfig, BuildsIndexInputs)
{
  const auto result = parse_project_config(
    "autoload_paths:\n"
    "  - path: app/models\n"
    "  - path: lib\n"
    "    namespace: Acme\n"
    "collapse: [app/models/shared]\n"
    "inflections:\n"
    "  acronyms: [HTML]\n"
    "  irregular: { criterion: criteria }\n"
    "inspectors: [associations, constants]\n",
    "/work");
  ASSERT_TRUE(result.success) << result.error;

  const auto roots = make_autoload_roots(result.config);
  ASSERT_EQ(roots.size(), 2U);
  EXPECT_FALSE(roots[0].is_namespaced());
  EXPECT_EQ(roots[1].base_namespace, NamespacePath{"Acme"});

  const auto options = make_scan_options(result.config);
  ASSERT_EQ(options.collapse.size(), 1U);
  EXPECT_EQ(options.extensions, (std::vector<std::string>{".rb"}));

  const auto inflector = make_inflector(result.config);
  EXPECT_EQ(inflector.camelize("html_parser"), "HTMLParser");
  EXPECT_EQ(inflector.singularize("criteria"), "criterion");

  EXPECT_EQ(make_inspectors(result.config).size(), 2U);
}

TEST(ProjectConfig, DefaultConfigurationUsesRailsDirectories)
{
  const auto config = default_project_config("/work/shop");

  EXPECT_EQ(config.project_root, fs::path("/work/shop"));
  ASSERT_FALSE(config.autoload_paths.empty());
  bool has_models = false;
  for (const auto & entry : config.autoload_paths) {
    has_models = has_models || entry.path == fs::path("app/models");
    EXPECT_FALSE(entry.namespace_name.has_value());
  }
  EXPECT_TRUE(has_models);
  EXPECT_EQ(config.inspectors, (std::vector<std::string>{"constants"}));
}
