// tests/unit/extractor/test_extractor.cpp - End-to-end reference extraction
//
// Builds small Rails-style projects on disk, indexes them and extracts
// references from snippets and files.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "../support/fixture_project.hpp"
#include "ratchet/analysis/association_inspector.hpp"
#include "ratchet/analysis/const_node_inspector.hpp"
#include "ratchet/basic/errors.hpp"
#include "ratchet/extractor.hpp"

using namespace ratchet;
using ratchet::testing::FixtureProject;

namespace fs = std::filesystem;

namespace
{

/// app/models with Order, Billing::Invoice and a Billing namespace directory
void write_shop(const FixtureProject & project)
{
  project.write_file("app/models/order.rb", "class Order\nend\n");
  project.write_file(
    "app/models/billing/invoice.rb",
    "module Billing\n"
    "  class Invoice\n"
    "    def x\n"
    "      Order\n"
    "    end\n"
    "  end\n"
    "end\n");
}

NamespaceIndex index_models(const FixtureProject & project)
{
  return NamespaceIndex::scan(project.root(), {AutoloadRoot{"app/models", {}}}, Inflector{});
}

std::vector<std::string> constant_names(const std::vector<Reference> & refs)
{
  std::vector<std::string> out;
  for (const auto & ref : refs) {
    out.push_back(ref.constant.name());
  }
  return out;
}

}  // namespace

// ============================================================================
// Snippets
// ============================================================================

TEST(Extractor, SnippetReferenceToProjectConstant)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_string("Order.find(1)");

  ASSERT_EQ(refs.size(), 1U);
  EXPECT_EQ(refs[0].relative_path, "<snippet>");
  EXPECT_EQ(refs[0].constant.name(), "Order");
  ASSERT_TRUE(refs[0].constant.defining_file.has_value());
  EXPECT_EQ(refs[0].constant.defining_file->generic_string(), "app/models/order.rb");
  EXPECT_EQ(refs[0].location.start_line, 1U);
  EXPECT_EQ(refs[0].location.start_column, 1U);
  EXPECT_EQ(refs[0].location.start_byte, 0U);
  EXPECT_EQ(refs[0].location.end_byte, 5U);
}

TEST(Extractor, RootAnchoredResolvesRegardlessOfScope)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto top = extractor.references_from_string("::Billing::Invoice.new");
  const auto nested = extractor.references_from_string(
    "module Shipping\n"
    "  class Label\n"
    "    ::Billing::Invoice.new\n"
    "  end\n"
    "end\n");

  ASSERT_EQ(top.size(), 1U);
  ASSERT_EQ(nested.size(), 1U);
  EXPECT_EQ(top[0].constant, nested[0].constant);
  EXPECT_EQ(nested[0].constant.defining_file->generic_string(), "app/models/billing/invoice.rb");
  EXPECT_EQ(nested[0].location.start_line, 3U);
}

TEST(Extractor, InnermostScopeWinsOverOuter)
{
  FixtureProject project;
  project.write_file("app/models/a/x.rb");
  project.write_file("app/models/a/b/x.rb");
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_string(
    "module A\n"
    "  module B\n"
    "    X\n"
    "  end\n"
    "  X\n"
    "end\n");

  EXPECT_EQ(constant_names(refs), (std::vector<std::string>{"A::B::X", "A::X"}));
}

TEST(Extractor, ExternalAndPureNamespaceReferencesAreDropped)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_string(
    "class Report < ActiveRecord::Base\n"
    "  Billing\n"
    "  JSON.parse(Order.to_json)\n"
    "end\n");

  EXPECT_EQ(constant_names(refs), (std::vector<std::string>{"Order"}));
}

TEST(Extractor, NoConstantsGivesEmptyResult)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  EXPECT_TRUE(extractor.references_from_string("x = 1 + 2\nputs x\n").empty());
  EXPECT_TRUE(extractor.references_from_string("").empty());
}

TEST(Extractor, UnparseableSnippetGivesEmptyResult)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  Extractor extractor(project.root(), index);

  std::vector<std::string> failures;
  extractor.set_parse_failure_handler([&](const ParseFailure & failure) {
    failures.push_back(failure.relative_path);
    EXPECT_TRUE(failure.unit.diags.has_errors());
  });

  EXPECT_TRUE(extractor.references_from_string("class Order\n  def (\n").empty());
  EXPECT_EQ(failures, (std::vector<std::string>{"<snippet>"}));
}

// ============================================================================
// Files
// ============================================================================

TEST(Extractor, FileReferenceFallsBackToTopLevel)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_file("app/models/billing/invoice.rb");

  ASSERT_EQ(refs.size(), 1U);
  EXPECT_EQ(refs[0].relative_path, "app/models/billing/invoice.rb");
  EXPECT_EQ(refs[0].constant.name(), "Order");
  EXPECT_EQ(refs[0].constant.defining_file->generic_string(), "app/models/order.rb");
  EXPECT_EQ(refs[0].location.start_line, 4U);
  EXPECT_EQ(refs[0].location.start_column, 7U);
}

TEST(Extractor, AbsolutePathIsReportedRelativeToRoot)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs =
    extractor.references_from_file(project.root() / "app" / "models" / "billing" / "invoice.rb");

  ASSERT_EQ(refs.size(), 1U);
  EXPECT_EQ(refs[0].relative_path, "app/models/billing/invoice.rb");
}

TEST(Extractor, MissingFileGivesEmptyResult)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  EXPECT_TRUE(extractor.references_from_file("app/models/nope.rb").empty());
}

TEST(Extractor, UnsupportedFileTypeThrows)
{
  FixtureProject project;
  write_shop(project);
  project.write_file("app/assets/logo.png", "PNG");
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  EXPECT_THROW((void)extractor.references_from_file("app/assets/logo.png"), UnsupportedFileError);
}

TEST(Extractor, SyntaxErrorFileGivesEmptyResult)
{
  FixtureProject project;
  write_shop(project);
  project.write_file("app/models/broken.rb", "class Broken\n  Order.find(\n");
  const auto index = index_models(project);
  Extractor extractor(project.root(), index);

  std::vector<std::string> failures;
  extractor.set_parse_failure_handler(
    [&](const ParseFailure & failure) { failures.push_back(failure.relative_path); });

  EXPECT_TRUE(extractor.references_from_file("app/models/broken.rb").empty());
  EXPECT_EQ(failures, (std::vector<std::string>{"app/models/broken.rb"}));
}

TEST(Extractor, RakeFilesUseTheRubyParser)
{
  FixtureProject project;
  write_shop(project);
  project.write_file("lib/tasks/cleanup.rake", "task :cleanup do\n  Order.delete_all\nend\n");
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_file("lib/tasks/cleanup.rake");
  EXPECT_EQ(constant_names(refs), (std::vector<std::string>{"Order"}));
}

TEST(Extractor, RepeatedExtractionIsIdentical)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto first = extractor.references_from_file("app/models/billing/invoice.rb");
  const auto second = extractor.references_from_file("app/models/billing/invoice.rb");
  EXPECT_EQ(first, second);
}

// ============================================================================
// Stages and Inspectors
// ============================================================================

TEST(Extractor, StagesCanBeDrivenSeparately)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const RubyParser parser;
  const auto unit = parser.parse({}, "Order\nUnknown\nBilling::Invoice\n");
  ASSERT_TRUE(unit->ok());

  const auto unresolved = extractor.collect_references(*unit->tree, "lib/script.rb");
  ASSERT_EQ(unresolved.size(), 3U);

  const auto refs = extractor.resolve_references(unresolved, unit->source);
  EXPECT_EQ(constant_names(refs), (std::vector<std::string>{"Order", "Billing::Invoice"}));
  EXPECT_EQ(refs[1].relative_path, "lib/script.rb");
  EXPECT_EQ(refs[1].location.start_line, 3U);
}

TEST(Extractor, InspectorsRunInRegistrationOrder)
{
  FixtureProject project;
  write_shop(project);
  project.write_file("app/models/billing/customer.rb");
  const auto index = index_models(project);

  const InspectorList inspectors = {
    std::make_shared<const ConstNodeInspector>(), std::make_shared<const AssociationInspector>()};
  const Extractor extractor(project.root(), index, inspectors);

  const auto refs = extractor.references_from_string(
    "module Billing\n"
    "  class Customer\n"
    "    has_many :invoices\n"
    "    Order\n"
    "  end\n"
    "end\n");

  EXPECT_EQ(constant_names(refs), (std::vector<std::string>{"Billing::Invoice", "Order"}));
}

TEST(Extractor, DefaultInspectorsIgnoreAssociations)
{
  FixtureProject project;
  write_shop(project);
  const auto index = index_models(project);
  const Extractor extractor(project.root(), index);

  const auto refs = extractor.references_from_string(
    "module Billing\n"
    "  has_many :invoices\n"
    "end\n");
  EXPECT_TRUE(refs.empty());
}
