// ratchet/output/json_writer.hpp - JSON serialization of analysis results
//
// Returns nlohmann::json objects for references, the namespace index and
// the dependency graph, as printed by `ratchet --format json`.
//
#pragma once

#include <nlohmann/json.hpp>

#include <vector>

#include "ratchet/analysis/reference.hpp"
#include "ratchet/driver/dependency_graph.hpp"
#include "ratchet/index/namespace_index.hpp"

namespace ratchet
{

/**
 * Serialize a reference.
 *
 * @code
 *   {"file": "app/models/user.rb",
 *    "location": {"start": {"line": 1, "column": 1, "offset": 0}, "end": {...}},
 *    "constant": {"name": "Order", "defining_file": "app/models/order.rb"}}
 * @endcode
 */
[[nodiscard]] nlohmann::json to_json(const Reference & reference);

/// Serialize a list of references as a JSON array
[[nodiscard]] nlohmann::json to_json(const std::vector<Reference> & references);

/// Serialize the index: its roots and every entry in path order
[[nodiscard]] nlohmann::json to_json(const NamespaceIndex & index);

/// Serialize the graph as {"files": [...], "edges": [...]}
[[nodiscard]] nlohmann::json to_json(const DependencyGraph & graph);

}  // namespace ratchet
