// ratchet/naming/inflector.hpp - File name <-> constant name convention
//
// The autoloading convention maps a snake_case file or directory name to a
// CamelCase constant segment. This transform decides which file is expected
// to define which constant, so it is kept pure and separately testable.
//
#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ratchet
{

/**
 * Snake-case/camel-case conversion with acronym and override support.
 *
 * camelize():
 *  - an override registered for the whole basename wins;
 *  - otherwise the basename is split on '_'; empty words are dropped, so
 *    "foo__bar", "_foo_bar" and "foo_bar_" all camelize to "FooBar";
 *  - a word equal (case-insensitively) to a registered acronym becomes the
 *    acronym ("html" -> "HTML" when HTML is registered);
 *  - any other word is capitalized: first character upper-cased, the rest
 *    lower-cased ("iPhone" -> "Iphone"); digits are kept ("v2" -> "V2").
 *
 * underscore() is the inverse for every name camelize() produces. Without a
 * registered acronym, "HTMLParser" underscores to "html_parser", which
 * camelizes back to "HtmlParser".
 */
class Inflector
{
public:
  Inflector();

  /// Register an acronym such as "HTML" or "API"
  void add_acronym(std::string acronym);

  /// Map a whole basename to a constant name ("html_parser" -> "HTMLParser")
  void add_override(std::string basename, std::string constant_name);

  /// Register an irregular singular/plural pair ("person", "people")
  void add_irregular(std::string singular, std::string plural);

  /// Register a word whose plural is identical to its singular
  void add_uncountable(std::string word);

  [[nodiscard]] std::string camelize(std::string_view basename) const;
  [[nodiscard]] std::string underscore(std::string_view constant_name) const;

  /// Singular form of a lower-case English plural ("line_items" -> "line_item")
  [[nodiscard]] std::string singularize(std::string_view word) const;

private:
  /// Longest acronym matching at `pos` that ends a word, or empty
  [[nodiscard]] std::string_view match_acronym(std::string_view name, size_t pos) const;

  std::map<std::string, std::string> acronyms_;       ///< lower-case -> spelling
  std::map<std::string, std::string> overrides_;      ///< basename -> constant
  std::map<std::string, std::string> reverse_overrides_;  ///< constant -> basename
  std::map<std::string, std::string> irregular_plurals_;  ///< plural -> singular
  std::set<std::string> uncountables_;
};

}  // namespace ratchet
