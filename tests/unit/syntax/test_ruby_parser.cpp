// tests/unit/syntax/test_ruby_parser.cpp - Unit tests for the Ruby front end

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "ratchet/syntax/parser.hpp"

using namespace ratchet;

namespace
{

class FakeParser final : public Parser
{
public:
  std::unique_ptr<ParsedUnit> parse(std::filesystem::path, std::string) const override
  {
    return std::make_unique<ParsedUnit>();
  }
};

}  // namespace

// ============================================================================
// RubyParser
// ============================================================================

TEST(SyntaxRubyParser, KeepsNamedNodesWithFields)
{
  const RubyParser parser;
  const auto unit = parser.parse("app/models/a.rb", "Billing::Invoice.new\n");

  ASSERT_TRUE(unit->ok());
  EXPECT_TRUE(unit->diags.empty());
  EXPECT_EQ(unit->source.get_file_path(), std::filesystem::path("app/models/a.rb"));

  const SyntaxNode * root = unit->tree->root();
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->kind(), "program");
  ASSERT_EQ(root->children().size(), 1U);

  const SyntaxNode * call = root->children()[0];
  EXPECT_EQ(call->kind(), "call");
  EXPECT_EQ(call->parent(), root);

  const SyntaxNode * receiver = call->child_by_field("receiver");
  ASSERT_NE(receiver, nullptr);
  EXPECT_EQ(receiver->kind(), "scope_resolution");
  EXPECT_EQ(receiver->text(), "Billing::Invoice");
  EXPECT_EQ(receiver->field(), "receiver");

  const SyntaxNode * name = receiver->child_by_field("name");
  ASSERT_NE(name, nullptr);
  EXPECT_EQ(name->text(), "Invoice");
  EXPECT_EQ(receiver->child_by_field("scope")->text(), "Billing");

  // Anonymous tokens such as "::" and "." are not kept
  for (const SyntaxNode * child : receiver->children()) {
    EXPECT_EQ(child->kind(), "constant");
  }
}

TEST(SyntaxRubyParser, RootAnchoredScopeResolutionHasNoScope)
{
  const RubyParser parser;
  const auto unit = parser.parse({}, "::Foo\n");

  ASSERT_TRUE(unit->ok());
  const SyntaxNode * node = unit->tree->root()->children()[0];
  EXPECT_EQ(node->kind(), "scope_resolution");
  EXPECT_EQ(node->child_by_field("scope"), nullptr);
  EXPECT_NE(node->child_by_field("name"), nullptr);
}

TEST(SyntaxRubyParser, SyntaxErrorYieldsDiagnosticsAndNoTree)
{
  const RubyParser parser;
  const auto unit = parser.parse("broken.rb", "class Foo\n  def bar(\nend\n");

  EXPECT_FALSE(unit->ok());
  EXPECT_EQ(unit->tree, nullptr);
  ASSERT_TRUE(unit->diags.has_errors());
  const auto & first = unit->diags.all().front();
  EXPECT_TRUE(first.code == "R001" || first.code == "R002");
}

TEST(SyntaxRubyParser, EmptySourceParses)
{
  const RubyParser parser;
  const auto unit = parser.parse({}, "");

  ASSERT_TRUE(unit->ok());
  EXPECT_TRUE(unit->tree->root()->children().empty());
}

// ============================================================================
// ParserFactory
// ============================================================================

TEST(SyntaxParserFactory, DefaultsCoverRubyFileTypes)
{
  const auto factory = ParserFactory::with_defaults();

  for (const char * path :
       {"app/models/user.rb", "lib/tasks/db.rake", "config.ru", "ratchet.gemspec", "Gemfile",
        "Rakefile"}) {
    EXPECT_NE(factory.for_path(path), nullptr) << path;
  }
  EXPECT_EQ(factory.for_path("app/assets/logo.png"), nullptr);
  EXPECT_EQ(factory.for_path("README"), nullptr);
  EXPECT_EQ(factory.for_path("Gemfile.lock"), nullptr);
}

TEST(SyntaxParserFactory, RegistrationsAreOpen)
{
  ParserFactory factory;
  EXPECT_EQ(factory.for_path("view.erb"), nullptr);

  auto fake = std::make_shared<const FakeParser>();
  factory.register_extensions({".erb"}, fake);
  factory.register_file_names({"Guardfile"}, fake);

  EXPECT_EQ(factory.for_path("app/views/view.erb"), fake.get());
  EXPECT_EQ(factory.for_path("Guardfile"), fake.get());
}
