#pragma once

#include "models.hpp"
#include "result.hpp"

#include <cstdint>
#include <map>
#include <optional>

#include <nlohmann/json.hpp>

namespace graph_http {

// Shape checks. Each accepts the two encodings the server produces.
//
// Graph format (the "graph" result data contents):
//   Relationship: id, type, startNode, endNode, properties
//   Node:         id, labels (array of strings), properties
//   Path:         nodes (Node-shaped), relationships (Relationship-shaped),
//                 nodes.size() == relationships.size() + 1
//
// REST format (the cypher endpoint and the "rest" result data contents):
//   Relationship: self, start and end entity URLs, metadata {id, type}, data
//   Node:         self, metadata {id, labels}, data
//   Path:         start and end URLs, nodes and relationships as arrays of
//                 entity URLs with the same count rule as above
bool isRelationshipShape(const nlohmann::json& raw);
bool isNodeShape(const nlohmann::json& raw);
bool isPathShape(const nlohmann::json& raw);

/// Identity as integer or decimal string ("123"); nullopt otherwise.
std::optional<std::int64_t> parseIdentity(const nlohmann::json& raw);

/// Identity from the last segment of an entity URL
/// ("http://host:7474/db/data/node/7" -> 7); nullopt otherwise.
std::optional<std::int64_t> parseEntityUrl(const nlohmann::json& raw);

/// Entities of a "graph" data part, by identity. REST paths only carry
/// entity URLs; their elements are resolved through this index.
struct GraphIndex {
    std::map<std::int64_t, Node>         nodes;
    std::map<std::int64_t, Relationship> relationships;
};

GraphIndex indexGraph(const nlohmann::json& graph);

/// Classify and hydrate one raw value. Relationship, then Node, then Path,
/// then opaque (arrays and objects recurse). In lean mode entities become
/// their property maps and a path becomes a list of alternating maps.
///
/// Path elements that the index cannot resolve keep their identity only:
/// nodes without labels or properties, relationships without a type, with
/// endpoints taken from the path order and its "directions".
Value hydrateValue(const nlohmann::json& raw, bool lean = false,
                   const GraphIndex* index = nullptr);

/// One entry of the transaction endpoint's "results" array:
/// {"columns": [...], "data": [entry, ...]} where each entry carries
/// "rest" (preferred, resolved against its "graph" part), "row" or "graph".
Result<QueryResult> hydrateStatementResult(const nlohmann::json& result, bool lean);

/// Body of the single-statement endpoint:
/// {"columns": [...], "data": [[...], ...]} with values in REST format.
Result<QueryResult> hydrateCypherResult(const nlohmann::json& body, bool lean);

} // namespace graph_http
