// ratchet/analysis/association_inspector.hpp - Model association inspector
#pragma once

#include "ratchet/analysis/inspector.hpp"
#include "ratchet/naming/inflector.hpp"

namespace ratchet
{

/**
 * Reports the model class named by an association macro.
 *
 *   has_many :line_items                      -> LineItem
 *   belongs_to :author, class_name: "User"    -> User
 *   has_one :profile, class_name: "::Profile" -> ::Profile
 *
 * Recognized macros are `has_many`, `has_one`, `belongs_to` and
 * `has_and_belongs_to_many`, called without a receiver with a symbol as the
 * first argument. Collection associations are singularized. Interpolated
 * `class_name:` strings are dynamic and ignored.
 */
class AssociationInspector final : public ConstantNameInspector
{
public:
  explicit AssociationInspector(Inflector inflector = {}) : inflector_(std::move(inflector)) {}

  [[nodiscard]] std::optional<UnresolvedReference> inspect(
    const SyntaxNode & node, const ScopeStack & scope,
    const std::string & relative_path) const override;

private:
  Inflector inflector_;
};

}  // namespace ratchet
