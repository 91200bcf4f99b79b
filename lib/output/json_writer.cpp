// ratchet/output/json_writer.cpp - JSON serialization implementation
//
#include "ratchet/output/json_writer.hpp"

#include <string>

namespace ratchet
{
namespace
{

using nlohmann::json;

json j_position(uint32_t line, uint32_t column, uint32_t offset)
{
  return json{{"line", line}, {"column", column}, {"offset", offset}};
}

json j_location(const FullSourceRange & r)
{
  return json{
    {"start", j_position(r.start_line, r.start_column, r.start_byte)},
    {"end", j_position(r.end_line, r.end_column, r.end_byte)}};
}

json j_optional_path(const std::optional<std::filesystem::path> & p)
{
  if (!p) return nullptr;
  return p->generic_string();
}

}  // namespace

json to_json(const Reference & reference)
{
  return json{
    {"file", reference.relative_path},
    {"location", j_location(reference.location)},
    {"constant",
     json{
       {"name", reference.constant.name()},
       {"defining_file", j_optional_path(reference.constant.defining_file)}}}};
}

json to_json(const std::vector<Reference> & references)
{
  json arr = json::array();
  for (const auto & ref : references) {
    arr.push_back(to_json(ref));
  }
  return arr;
}

json to_json(const NamespaceIndex & index)
{
  json roots = json::array();
  for (const auto & root : index.roots()) {
    roots.push_back(json{
      {"directory", root.directory.generic_string()},
      {"namespace", root.base_namespace.qualified_name()}});
  }

  json entries = json::array();
  for (const auto & [path, entry] : index) {
    if (path.empty()) continue;
    entries.push_back(json{
      {"name", path.qualified_name()},
      {"file", j_optional_path(entry.file)},
      {"directory", entry.is_directory}});
  }

  return json{{"root", index.project_root().generic_string()}, {"roots", roots}, {"entries", entries}};
}

json to_json(const DependencyGraph & graph)
{
  json edges = json::array();
  for (const auto & edge : graph.edges()) {
    json constants = json::array();
    for (const auto & c : edge.constants) {
      constants.push_back(c.qualified_name());
    }
    edges.push_back(json{
      {"from", edge.from},
      {"to", edge.to},
      {"references", edge.reference_count},
      {"constants", constants}});
  }

  return json{{"files", graph.files()}, {"edges", edges}};
}

}  // namespace ratchet
