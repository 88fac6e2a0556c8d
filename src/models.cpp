#include "models.hpp"

#include <algorithm>
#include <utility>

namespace graph_http {

bool Node::hasLabel(const std::string& label) const {
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value::Value() : mData(std::in_place_type<nlohmann::json>) {}
Value::Value(nlohmann::json scalar) : mData(std::in_place_type<nlohmann::json>, std::move(scalar)) {}
Value::Value(Node node) : mData(std::in_place_type<Node>, std::move(node)) {}
Value::Value(Relationship relationship)
    : mData(std::in_place_type<Relationship>, std::move(relationship)) {}
Value::Value(Path path) : mData(std::in_place_type<Path>, std::move(path)) {}
Value::Value(List list) : mData(std::in_place_type<List>, std::move(list)) {}
Value::Value(Map map) : mData(std::in_place_type<Map>, std::move(map)) {}

Value::Kind Value::kind() const {
    return static_cast<Kind>(mData.index());
}

bool Value::isNull() const {
    return isScalar() && asScalar().is_null();
}

const nlohmann::json& Value::asScalar() const   { return std::get<nlohmann::json>(mData); }
const Node& Value::asNode() const                { return std::get<Node>(mData); }
const Relationship& Value::asRelationship() const { return std::get<Relationship>(mData); }
const Path& Value::asPath() const                { return std::get<Path>(mData); }
const Value::List& Value::asList() const         { return std::get<List>(mData); }
const Value::Map& Value::asMap() const           { return std::get<Map>(mData); }

nlohmann::json Value::toJson() const {
    switch (kind()) {
        case Kind::Scalar:       return asScalar();
        case Kind::Node:         return graph_http::toJson(asNode());
        case Kind::Relationship: return graph_http::toJson(asRelationship());
        case Kind::Path:         return graph_http::toJson(asPath());
        case Kind::List: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : asList()) {
                out.push_back(item.toJson());
            }
            return out;
        }
        case Kind::Map: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, item] : asMap()) {
                out[key] = item.toJson();
            }
            return out;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Entity serialization
// ---------------------------------------------------------------------------

nlohmann::json toJson(const Node& node) {
    return {
        {"id", node.id},
        {"labels", node.labels},
        {"properties", node.properties}
    };
}

nlohmann::json toJson(const Relationship& relationship) {
    return {
        {"id", relationship.id},
        {"type", relationship.type},
        {"startNode", relationship.startNodeId},
        {"endNode", relationship.endNodeId},
        {"properties", relationship.properties}
    };
}

nlohmann::json toJson(const Path& path) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : path.nodes) {
        nodes.push_back(toJson(node));
    }
    nlohmann::json relationships = nlohmann::json::array();
    for (const auto& relationship : path.relationships) {
        relationships.push_back(toJson(relationship));
    }
    return {
        {"nodes", nodes},
        {"relationships", relationships},
        {"length", path.length()}
    };
}

} // namespace graph_http
