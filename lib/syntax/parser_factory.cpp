// ratchet/syntax/parser_factory.cpp - Parser selection by file type
#include "ratchet/syntax/parser.hpp"

namespace ratchet
{

ParserFactory ParserFactory::with_defaults()
{
  ParserFactory factory;
  auto ruby = std::make_shared<const RubyParser>();
  factory.register_extensions({".rb", ".rake", ".ru", ".gemspec"}, ruby);
  factory.register_file_names({"Gemfile", "Rakefile"}, ruby);
  return factory;
}

void ParserFactory::register_extensions(
  const std::vector<std::string> & extensions, std::shared_ptr<const Parser> parser)
{
  for (const auto & ext : extensions) {
    by_extension_[ext] = parser;
  }
}

void ParserFactory::register_file_names(
  const std::vector<std::string> & file_names, std::shared_ptr<const Parser> parser)
{
  for (const auto & name : file_names) {
    by_file_name_[name] = parser;
  }
}

const Parser * ParserFactory::for_path(const std::filesystem::path & path) const
{
  if (const auto it = by_file_name_.find(path.filename().string()); it != by_file_name_.end()) {
    return it->second.get();
  }
  if (const auto it = by_extension_.find(path.extension().string()); it != by_extension_.end()) {
    return it->second.get();
  }
  return nullptr;
}

}  // namespace ratchet
