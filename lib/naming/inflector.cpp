// ratchet/naming/inflector.cpp - File name <-> constant name convention
#include "ratchet/naming/inflector.hpp"

#include <cctype>
#include <utility>

namespace ratchet
{

namespace
{

char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char to_upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }
bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

std::string lower(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    out += to_lower(c);
  }
  return out;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Checked in order; the first matching suffix is replaced.
const std::vector<std::pair<std::string_view, std::string_view>> & singular_rules()
{
  static const std::vector<std::pair<std::string_view, std::string_view>> rules = {
    {"movies", "movie"}, {"statuses", "status"}, {"aliases", "alias"}, {"buses", "bus"},
    {"matrices", "matrix"}, {"vertices", "vertex"}, {"indices", "index"}, {"quizzes", "quiz"},
    {"sses", "ss"}, {"xes", "x"}, {"ches", "ch"}, {"shes", "sh"}, {"ies", "y"},
    {"ss", "ss"}, {"us", "us"}, {"s", ""},
  };
  return rules;
}

}  // namespace

Inflector::Inflector()
{
  add_irregular("person", "people");
  add_irregular("man", "men");
  add_irregular("child", "children");
  add_irregular("sex", "sexes");
  add_irregular("move", "moves");
  add_irregular("zombie", "zombies");
  for (const char * word :
       {"equipment", "information", "rice", "money", "species", "series", "fish", "sheep",
        "jeans", "police"}) {
    add_uncountable(word);
  }
}

void Inflector::add_acronym(std::string acronym)
{
  acronyms_[lower(acronym)] = std::move(acronym);
}

void Inflector::add_override(std::string basename, std::string constant_name)
{
  reverse_overrides_[constant_name] = basename;
  overrides_[std::move(basename)] = std::move(constant_name);
}

void Inflector::add_irregular(std::string singular, std::string plural)
{
  irregular_plurals_[std::move(plural)] = std::move(singular);
}

void Inflector::add_uncountable(std::string word) { uncountables_.insert(std::move(word)); }

std::string Inflector::camelize(std::string_view basename) const
{
  if (const auto it = overrides_.find(std::string(basename)); it != overrides_.end()) {
    return it->second;
  }

  std::string out;
  size_t start = 0;
  while (start <= basename.size()) {
    size_t end = basename.find('_', start);
    if (end == std::string_view::npos) {
      end = basename.size();
    }
    const std::string_view word = basename.substr(start, end - start);
    if (!word.empty()) {
      const std::string lowered = lower(word);
      if (const auto it = acronyms_.find(lowered); it != acronyms_.end()) {
        out += it->second;
      } else {
        out += to_upper(lowered.front());
        out.append(lowered, 1, std::string::npos);
      }
    }
    start = end + 1;
  }
  return out;
}

std::string_view Inflector::match_acronym(std::string_view name, size_t pos) const
{
  std::string_view best;
  for (const auto & [key, spelling] : acronyms_) {
    (void)key;
    if (spelling.size() <= best.size() || name.substr(pos, spelling.size()) != spelling) {
      continue;
    }
    const size_t after = pos + spelling.size();
    if (after < name.size() && is_lower(name[after])) {
      continue;
    }
    best = spelling;
  }
  return best;
}

std::string Inflector::underscore(std::string_view constant_name) const
{
  if (const auto it = reverse_overrides_.find(std::string(constant_name));
      it != reverse_overrides_.end()) {
    return it->second;
  }

  std::string out;
  bool after_acronym = false;
  size_t i = 0;
  while (i < constant_name.size()) {
    const std::string_view acronym = match_acronym(constant_name, i);
    if (!acronym.empty()) {
      if (!out.empty() && out.back() != '_') {
        out += '_';
      }
      out += lower(acronym);
      i += acronym.size();
      after_acronym = true;
      continue;
    }

    const char c = constant_name[i];
    if (is_upper(c) && !out.empty() && out.back() != '_') {
      const char prev = constant_name[i - 1];
      const bool next_is_lower = i + 1 < constant_name.size() && is_lower(constant_name[i + 1]);
      if (after_acronym || is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_is_lower)) {
        out += '_';
      }
    }
    out += (c == '-') ? '_' : to_lower(c);
    after_acronym = false;
    ++i;
  }
  return out;
}

std::string Inflector::singularize(std::string_view word) const
{
  // Only the last underscore-separated word is inflected ("line_items").
  const size_t last_sep = word.rfind('_');
  const std::string_view head =
    last_sep == std::string_view::npos ? std::string_view() : word.substr(0, last_sep + 1);
  const std::string_view tail =
    last_sep == std::string_view::npos ? word : word.substr(last_sep + 1);

  const std::string tail_str(tail);
  if (tail_str.empty() || uncountables_.count(tail_str) > 0) {
    return std::string(word);
  }
  if (const auto it = irregular_plurals_.find(tail_str); it != irregular_plurals_.end()) {
    return std::string(head) + it->second;
  }

  for (const auto & [suffix, replacement] : singular_rules()) {
    if (ends_with(tail, suffix) && (tail.size() > suffix.size() || !replacement.empty())) {
      std::string result(head);
      result.append(tail.substr(0, tail.size() - suffix.size()));
      result.append(replacement);
      return result;
    }
  }
  return std::string(word);
}

}  // namespace ratchet
