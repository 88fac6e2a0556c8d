#include "hydrator.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace graph_http {

namespace {

ErrorRecord malformed(std::string message) {
    return ErrorRecord::make(ErrorKind::Protocol, std::move(message));
}

bool isStringArray(const nlohmann::json& raw) {
    if (!raw.is_array()) {
        return false;
    }
    for (const auto& item : raw) {
        if (!item.is_string()) {
            return false;
        }
    }
    return true;
}

bool isUrlArray(const nlohmann::json& raw) {
    if (!raw.is_array()) {
        return false;
    }
    for (const auto& item : raw) {
        if (!parseEntityUrl(item)) {
            return false;
        }
    }
    return true;
}

bool hasIdentity(const nlohmann::json& raw, const char* field) {
    return raw.contains(field) && parseIdentity(raw[field]).has_value();
}

bool hasEntityUrl(const nlohmann::json& raw, const char* field) {
    return raw.contains(field) && parseEntityUrl(raw[field]).has_value();
}

bool hasPropertyMap(const nlohmann::json& raw) {
    return raw.contains("properties") && raw["properties"].is_object();
}

bool hasRestEnvelope(const nlohmann::json& raw) {
    return raw.is_object() &&
           raw.contains("self") && raw["self"].is_string() &&
           raw.contains("data") && raw["data"].is_object() &&
           raw.contains("metadata") && raw["metadata"].is_object() &&
           hasIdentity(raw["metadata"], "id");
}

std::optional<std::string> restRelationshipType(const nlohmann::json& raw) {
    const auto& metadata = raw["metadata"];
    if (metadata.contains("type") && metadata["type"].is_string()) {
        return metadata["type"].get<std::string>();
    }
    if (raw.contains("type") && raw["type"].is_string()) {
        return raw["type"].get<std::string>();
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Graph format
// ---------------------------------------------------------------------------

bool isGraphRelationship(const nlohmann::json& raw) {
    return raw.is_object() &&
           hasIdentity(raw, "startNode") &&
           hasIdentity(raw, "endNode") &&
           hasIdentity(raw, "id") &&
           raw.contains("type") && raw["type"].is_string() &&
           hasPropertyMap(raw);
}

bool isGraphNode(const nlohmann::json& raw) {
    return raw.is_object() &&
           raw.contains("labels") && isStringArray(raw["labels"]) &&
           hasIdentity(raw, "id") &&
           hasPropertyMap(raw);
}

bool hasPathCounts(const nlohmann::json& raw) {
    if (!raw.is_object() || !raw.contains("nodes") || !raw.contains("relationships")) {
        return false;
    }
    const auto& nodes         = raw["nodes"];
    const auto& relationships = raw["relationships"];
    if (!nodes.is_array() || !relationships.is_array() ||
        nodes.size() != relationships.size() + 1) {
        return false;
    }
    if (raw.contains("length")) {
        const auto& length = raw["length"];
        if (!length.is_number_integer() ||
            length.get<std::int64_t>() != static_cast<std::int64_t>(relationships.size())) {
            return false;
        }
    }
    return true;
}

bool isGraphPath(const nlohmann::json& raw) {
    if (!hasPathCounts(raw)) {
        return false;
    }
    for (const auto& node : raw["nodes"]) {
        if (!isGraphNode(node)) {
            return false;
        }
    }
    for (const auto& relationship : raw["relationships"]) {
        if (!isGraphRelationship(relationship)) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// REST format
// ---------------------------------------------------------------------------

bool isRestRelationship(const nlohmann::json& raw) {
    return hasRestEnvelope(raw) &&
           hasEntityUrl(raw, "start") &&
           hasEntityUrl(raw, "end") &&
           restRelationshipType(raw).has_value();
}

bool isRestNode(const nlohmann::json& raw) {
    return hasRestEnvelope(raw) &&
           raw["metadata"].contains("labels") && isStringArray(raw["metadata"]["labels"]);
}

bool isRestPath(const nlohmann::json& raw) {
    if (!hasPathCounts(raw) ||
        !hasEntityUrl(raw, "start") || !hasEntityUrl(raw, "end") ||
        !isUrlArray(raw["nodes"]) || !isUrlArray(raw["relationships"])) {
        return false;
    }
    if (raw.contains("directions")) {
        const auto& directions = raw["directions"];
        if (!isStringArray(directions) || directions.size() != raw["relationships"].size()) {
            return false;
        }
    }
    return true;
}

/// Property data is never entity-classified.
Value plainValue(const nlohmann::json& raw) {
    if (raw.is_array()) {
        Value::List list;
        list.reserve(raw.size());
        for (const auto& item : raw) {
            list.push_back(plainValue(item));
        }
        return Value(std::move(list));
    }
    if (raw.is_object()) {
        Value::Map map;
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            map.emplace(it.key(), plainValue(it.value()));
        }
        return Value(std::move(map));
    }
    return Value(raw);
}

Node toNode(const nlohmann::json& raw) {
    Node node;
    if (isGraphNode(raw)) {
        node.id         = *parseIdentity(raw["id"]);
        node.labels     = raw["labels"].get<std::vector<std::string>>();
        node.properties = raw["properties"];
    } else {
        node.id         = *parseIdentity(raw["metadata"]["id"]);
        node.labels     = raw["metadata"]["labels"].get<std::vector<std::string>>();
        node.properties = raw["data"];
    }
    return node;
}

Relationship toRelationship(const nlohmann::json& raw) {
    Relationship relationship;
    if (isGraphRelationship(raw)) {
        relationship.id          = *parseIdentity(raw["id"]);
        relationship.type        = raw["type"].get<std::string>();
        relationship.properties  = raw["properties"];
        relationship.startNodeId = *parseIdentity(raw["startNode"]);
        relationship.endNodeId   = *parseIdentity(raw["endNode"]);
    } else {
        relationship.id          = *parseIdentity(raw["metadata"]["id"]);
        relationship.type        = *restRelationshipType(raw);
        relationship.properties  = raw["data"];
        relationship.startNodeId = *parseEntityUrl(raw["start"]);
        relationship.endNodeId   = *parseEntityUrl(raw["end"]);
    }
    return relationship;
}

Path graphPath(const nlohmann::json& raw) {
    Path path;
    for (const auto& node : raw["nodes"]) {
        path.nodes.push_back(toNode(node));
    }
    for (const auto& relationship : raw["relationships"]) {
        path.relationships.push_back(toRelationship(relationship));
    }
    return path;
}

Path restPath(const nlohmann::json& raw, const GraphIndex* index) {
    const auto& nodes         = raw["nodes"];
    const auto& relationships = raw["relationships"];

    Path path;
    for (const auto& url : nodes) {
        auto id = *parseEntityUrl(url);
        if (index) {
            auto found = index->nodes.find(id);
            if (found != index->nodes.end()) {
                path.nodes.push_back(found->second);
                continue;
            }
        }
        Node node;
        node.id = id;
        path.nodes.push_back(std::move(node));
    }
    for (std::size_t i = 0; i < relationships.size(); ++i) {
        auto id = *parseEntityUrl(relationships[i]);
        if (index) {
            auto found = index->relationships.find(id);
            if (found != index->relationships.end()) {
                path.relationships.push_back(found->second);
                continue;
            }
        }
        bool backwards = raw.contains("directions") && raw["directions"][i] == "<-";
        Relationship relationship;
        relationship.id          = id;
        relationship.startNodeId = path.nodes[backwards ? i + 1 : i].id;
        relationship.endNodeId   = path.nodes[backwards ? i : i + 1].id;
        path.relationships.push_back(std::move(relationship));
    }
    return path;
}

Value leanPath(const Path& path) {
    Value::List segments;
    segments.reserve(path.nodes.size() + path.relationships.size());
    for (std::size_t i = 0; i < path.nodes.size(); ++i) {
        segments.push_back(plainValue(path.nodes[i].properties));
        if (i < path.relationships.size()) {
            segments.push_back(plainValue(path.relationships[i].properties));
        }
    }
    return Value(std::move(segments));
}

Result<std::vector<std::string>> parseColumns(const nlohmann::json& container) {
    if (!container.is_object() || !container.contains("columns")) {
        return malformed("Result missing 'columns' field");
    }
    if (!isStringArray(container["columns"])) {
        return malformed("Result 'columns' is not an array of strings");
    }
    return container["columns"].get<std::vector<std::string>>();
}

Result<Row> hydrateRow(const std::vector<std::string>& columns,
                       const nlohmann::json& values,
                       bool lean,
                       std::size_t rowIndex,
                       const GraphIndex* index = nullptr) {
    if (!values.is_array()) {
        return malformed("Row " + std::to_string(rowIndex) + " is not an array");
    }
    if (values.size() != columns.size()) {
        return malformed("Row " + std::to_string(rowIndex) + " has " +
                         std::to_string(values.size()) + " values for " +
                         std::to_string(columns.size()) + " columns");
    }
    Row row;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        row[columns[i]] = hydrateValue(values[i], lean, index);
    }
    return row;
}

/// "graph" data entries carry the entities touched by the row.
Row hydrateGraphEntry(const nlohmann::json& graph, bool lean) {
    Value::List nodes;
    Value::List relationships;
    if (graph.contains("nodes") && graph["nodes"].is_array()) {
        for (const auto& node : graph["nodes"]) {
            nodes.push_back(hydrateValue(node, lean));
        }
    }
    if (graph.contains("relationships") && graph["relationships"].is_array()) {
        for (const auto& relationship : graph["relationships"]) {
            relationships.push_back(hydrateValue(relationship, lean));
        }
    }
    Row row;
    row["nodes"]         = Value(std::move(nodes));
    row["relationships"] = Value(std::move(relationships));
    return row;
}

} // namespace

// ---------------------------------------------------------------------------
// Shape checks
// ---------------------------------------------------------------------------

std::optional<std::int64_t> parseIdentity(const nlohmann::json& raw) {
    if (raw.is_number_unsigned()) {
        auto value = raw.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (raw.is_number_integer()) {
        return raw.get<std::int64_t>();
    }
    if (raw.is_string()) {
        const auto& text = raw.get_ref<const std::string&>();
        if (text.empty() || text.find_first_not_of("-0123456789") != std::string::npos) {
            return std::nullopt;
        }
        std::size_t consumed = 0;
        try {
            auto value = std::stoll(text, &consumed, 10);
            if (consumed == text.size()) {
                return static_cast<std::int64_t>(value);
            }
        } catch (const std::logic_error&) {
            // invalid_argument or out_of_range: not an identity
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> parseEntityUrl(const nlohmann::json& raw) {
    if (!raw.is_string()) {
        return std::nullopt;
    }
    const auto& url = raw.get_ref<const std::string&>();
    auto slash = url.rfind('/');
    if (slash == std::string::npos || slash + 1 == url.size()) {
        return std::nullopt;
    }
    auto id = parseIdentity(nlohmann::json(url.substr(slash + 1)));
    if (!id || *id < 0) {
        return std::nullopt;
    }
    return id;
}

bool isRelationshipShape(const nlohmann::json& raw) {
    return isGraphRelationship(raw) || isRestRelationship(raw);
}

bool isNodeShape(const nlohmann::json& raw) {
    return isGraphNode(raw) || isRestNode(raw);
}

bool isPathShape(const nlohmann::json& raw) {
    return isGraphPath(raw) || isRestPath(raw);
}

GraphIndex indexGraph(const nlohmann::json& graph) {
    GraphIndex index;
    if (!graph.is_object()) {
        return index;
    }
    if (graph.contains("nodes") && graph["nodes"].is_array()) {
        for (const auto& node : graph["nodes"]) {
            if (isGraphNode(node)) {
                auto hydrated = toNode(node);
                index.nodes[hydrated.id] = std::move(hydrated);
            }
        }
    }
    if (graph.contains("relationships") && graph["relationships"].is_array()) {
        for (const auto& relationship : graph["relationships"]) {
            if (isGraphRelationship(relationship)) {
                auto hydrated = toRelationship(relationship);
                index.relationships[hydrated.id] = std::move(hydrated);
            }
        }
    }
    return index;
}

// ---------------------------------------------------------------------------
// Hydration
// ---------------------------------------------------------------------------

Value hydrateValue(const nlohmann::json& raw, bool lean, const GraphIndex* index) {
    if (isRelationshipShape(raw)) {
        auto relationship = toRelationship(raw);
        return lean ? plainValue(relationship.properties) : Value(std::move(relationship));
    }
    if (isNodeShape(raw)) {
        auto node = toNode(raw);
        return lean ? plainValue(node.properties) : Value(std::move(node));
    }
    if (isGraphPath(raw) || isRestPath(raw)) {
        auto path = isGraphPath(raw) ? graphPath(raw) : restPath(raw, index);
        return lean ? leanPath(path) : Value(std::move(path));
    }

    if (raw.is_array()) {
        Value::List list;
        list.reserve(raw.size());
        for (const auto& item : raw) {
            list.push_back(hydrateValue(item, lean, index));
        }
        return Value(std::move(list));
    }
    if (raw.is_object()) {
        Value::Map map;
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            map.emplace(it.key(), hydrateValue(it.value(), lean, index));
        }
        return Value(std::move(map));
    }
    return Value(raw);
}

Result<QueryResult> hydrateStatementResult(const nlohmann::json& result, bool lean) {
    try {
        auto columns = parseColumns(result);
        if (!columns) {
            return columns.error();
        }
        if (!result.contains("data") || !result["data"].is_array()) {
            return malformed("Result 'data' is missing or not an array");
        }

        QueryResult hydrated;
        hydrated.columns = std::move(columns).value();

        const auto& data = result["data"];
        for (std::size_t i = 0; i < data.size(); ++i) {
            const auto& entry = data[i];
            if (entry.is_object() && entry.contains("rest")) {
                GraphIndex index;
                if (entry.contains("graph")) {
                    index = indexGraph(entry["graph"]);
                }
                auto row = hydrateRow(hydrated.columns, entry["rest"], lean, i, &index);
                if (!row) {
                    return row.error();
                }
                hydrated.rows.push_back(std::move(row).value());
            } else if (entry.is_object() && entry.contains("row")) {
                auto row = hydrateRow(hydrated.columns, entry["row"], lean, i);
                if (!row) {
                    return row.error();
                }
                hydrated.rows.push_back(std::move(row).value());
            } else if (entry.is_object() && entry.contains("graph")) {
                hydrated.rows.push_back(hydrateGraphEntry(entry["graph"], lean));
            } else {
                return malformed("Data entry " + std::to_string(i) +
                                 " has neither 'rest', 'row' nor 'graph'");
            }
        }
        return hydrated;

    } catch (const nlohmann::json::exception& e) {
        return malformed(std::string("Failed to hydrate result: ") + e.what());
    }
}

Result<QueryResult> hydrateCypherResult(const nlohmann::json& body, bool lean) {
    try {
        auto columns = parseColumns(body);
        if (!columns) {
            return columns.error();
        }
        if (!body.contains("data") || !body["data"].is_array()) {
            return malformed("Response 'data' is missing or not an array");
        }

        QueryResult hydrated;
        hydrated.columns = std::move(columns).value();

        const auto& data = body["data"];
        for (std::size_t i = 0; i < data.size(); ++i) {
            auto row = hydrateRow(hydrated.columns, data[i], lean, i);
            if (!row) {
                return row.error();
            }
            hydrated.rows.push_back(std::move(row).value());
        }
        return hydrated;

    } catch (const nlohmann::json::exception& e) {
        return malformed(std::string("Failed to hydrate result: ") + e.what());
    }
}

} // namespace graph_http
