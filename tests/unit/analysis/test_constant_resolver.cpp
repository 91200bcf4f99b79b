// tests/unit/analysis/test_constant_resolver.cpp - Unit tests for constant lookup
//
// Exercises the lookup rules with a hand-built index and scope stack; no
// parser is involved.
//

#include <gtest/gtest.h>

#include "ratchet/analysis/constant_resolver.hpp"

using namespace ratchet;

namespace
{

NamespaceIndex make_index()
{
  NamespaceIndex index("/project");
  index.add_file(NamespacePath{"User"}, "app/models/user.rb");
  index.add_file(NamespacePath{"Order"}, "app/models/order.rb");
  index.add_file(NamespacePath{"Order", "Line"}, "app/models/order/line.rb");
  index.add_namespace(NamespacePath{"Billing"}, true);
  index.add_file(NamespacePath{"Billing", "Invoice"}, "app/models/billing/invoice.rb");
  index.add_file(NamespacePath{"Billing", "Order"}, "app/models/billing/order.rb");
  index.add_file(NamespacePath{"Billing", "Tax", "Rate"}, "app/models/billing/tax/rate.rb");
  return index;
}

ConstantName name(std::initializer_list<std::string> segments, bool root_anchored = false)
{
  return ConstantName{root_anchored, NamespacePath(segments)};
}

/// Stack for `module <outer>; module <inner>; ...` with the given frames
ScopeStack scope_of(std::initializer_list<NamespacePath> frames)
{
  ScopeStack scope;
  for (const auto & f : frames) {
    scope.push(nullptr, f, false);
  }
  return scope;
}

UnresolvedReference ref(ConstantName n, ScopeStack scope)
{
  return UnresolvedReference{std::move(n), std::move(scope), "app/models/x.rb", SourceRange{}};
}

}  // namespace

// ============================================================================
// resolve_path
// ============================================================================

TEST(AnalysisConstantResolver, TopLevelReference)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);

  const auto path = resolver.resolve_path(name({"Order"}), ScopeStack{});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->qualified_name(), "Order");
}

TEST(AnalysisConstantResolver, InnermostFrameWins)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);
  const auto scope = scope_of({NamespacePath{"Billing"}});

  EXPECT_EQ(resolver.resolve_path(name({"Order"}), scope)->qualified_name(), "Billing::Order");
  EXPECT_EQ(resolver.resolve_path(name({"Invoice"}), scope)->qualified_name(), "Billing::Invoice");
}

TEST(AnalysisConstantResolver, FallsBackToEnclosingFrames)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);
  const auto scope = scope_of({NamespacePath{"Billing"}, NamespacePath{"Tax"}});

  // Billing::Tax::User and Billing::User are unknown; the top level has User.
  EXPECT_EQ(resolver.resolve_path(name({"User"}), scope)->qualified_name(), "User");
  EXPECT_EQ(resolver.resolve_path(name({"Rate"}), scope)->qualified_name(), "Billing::Tax::Rate");
  EXPECT_EQ(resolver.resolve_path(name({"Invoice"}), scope)->qualified_name(), "Billing::Invoice");
}

TEST(AnalysisConstantResolver, RemainingSegmentsAreNotSearchedLexically)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);
  const auto scope = scope_of({NamespacePath{"Billing"}});

  // `Order` binds to Billing::Order, so Order::Line is Billing::Order::Line,
  // which does not exist; the top-level Order::Line is not considered.
  EXPECT_FALSE(resolver.resolve_path(name({"Order", "Line"}), scope).has_value());

  EXPECT_EQ(
    resolver.resolve_path(name({"Order", "Line"}), ScopeStack{})->qualified_name(), "Order::Line");
}

TEST(AnalysisConstantResolver, RootAnchoredIgnoresScope)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);
  const auto scope = scope_of({NamespacePath{"Billing"}});

  EXPECT_EQ(resolver.resolve_path(name({"Order"}, true), scope)->qualified_name(), "Order");
  EXPECT_EQ(
    resolver.resolve_path(name({"Billing", "Invoice"}, true), scope)->qualified_name(),
    "Billing::Invoice");
  EXPECT_FALSE(resolver.resolve_path(name({"Invoice"}, true), scope).has_value());
}

TEST(AnalysisConstantResolver, CompactDeclarationIsOneFrame)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);

  // module Billing::Tax opens a single frame; Billing itself is not a frame.
  const auto scope = scope_of({NamespacePath{"Billing", "Tax"}});
  ASSERT_EQ(scope.depth(), 2U);
  EXPECT_EQ(scope.innermost().path.qualified_name(), "Billing::Tax");

  EXPECT_EQ(resolver.resolve_path(name({"Rate"}), scope)->qualified_name(), "Billing::Tax::Rate");
  EXPECT_FALSE(resolver.resolve_path(name({"Invoice"}), scope).has_value());
}

TEST(AnalysisConstantResolver, UnknownNamesDoNotResolve)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);

  EXPECT_FALSE(resolver.resolve_path(name({"ActiveRecord", "Base"}), ScopeStack{}).has_value());
  EXPECT_FALSE(resolver.resolve_path(name({"Billing", "Missing"}), ScopeStack{}).has_value());
  EXPECT_FALSE(resolver.resolve_path(ConstantName{}, ScopeStack{}).has_value());
}

// ============================================================================
// resolve
// ============================================================================

TEST(AnalysisConstantResolver, ResolveAttachesDefiningFile)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);

  const auto ctx = resolver.resolve(ref(name({"Invoice"}), scope_of({NamespacePath{"Billing"}})));
  ASSERT_TRUE(ctx.has_value());
  EXPECT_EQ(ctx->name(), "Billing::Invoice");
  ASSERT_TRUE(ctx->defining_file.has_value());
  EXPECT_EQ(ctx->defining_file->generic_string(), "app/models/billing/invoice.rb");
}

TEST(AnalysisConstantResolver, PureNamespaceIsDropped)
{
  const auto index = make_index();
  const ConstantResolver resolver(index);

  // Billing is known (it is a directory) but no file defines it.
  EXPECT_TRUE(resolver.resolve_path(name({"Billing"}), ScopeStack{}).has_value());
  EXPECT_FALSE(resolver.resolve(ref(name({"Billing"}), ScopeStack{})).has_value());
}
