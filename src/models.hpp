#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace graph_http {

/// Graph vertex snapshot. Identity is only meaningful within the database
/// instance that returned it.
struct Node {
    std::int64_t             id = 0;
    std::vector<std::string> labels;      // server order
    nlohmann::json           properties = nlohmann::json::object();

    bool hasLabel(const std::string& label) const;
};

/// Graph edge snapshot. Endpoints are identities, not owned nodes.
struct Relationship {
    std::int64_t   id = 0;
    std::string    type;
    nlohmann::json properties = nlohmann::json::object();
    std::int64_t   startNodeId = 0;
    std::int64_t   endNodeId   = 0;
};

/// Alternating node / relationship traversal.
/// nodes.size() == relationships.size() + 1 for every hydrated path.
struct Path {
    std::vector<Node>         nodes;
    std::vector<Relationship> relationships;

    std::size_t length() const { return relationships.size(); }
    const Node& start() const { return nodes.front(); }
    const Node& end() const { return nodes.back(); }
};

/// Hydrated value: scalar, entity, or a composite of values.
class Value {
public:
    enum class Kind { Scalar, Node, Relationship, Path, List, Map };

    using List = std::vector<Value>;
    using Map  = std::map<std::string, Value>;

    Value();
    Value(nlohmann::json scalar);
    Value(Node node);
    Value(Relationship relationship);
    Value(Path path);
    Value(List list);
    Value(Map map);

    Kind kind() const;

    bool isScalar() const       { return kind() == Kind::Scalar; }
    bool isNull() const;
    bool isNode() const         { return kind() == Kind::Node; }
    bool isRelationship() const { return kind() == Kind::Relationship; }
    bool isPath() const         { return kind() == Kind::Path; }
    bool isList() const         { return kind() == Kind::List; }
    bool isMap() const          { return kind() == Kind::Map; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    const nlohmann::json& asScalar() const;
    const Node&           asNode() const;
    const Relationship&   asRelationship() const;
    const Path&           asPath() const;
    const List&           asList() const;
    const Map&            asMap() const;

    /// Re-serialize; entities use the graph format.
    nlohmann::json toJson() const;

private:
    std::variant<nlohmann::json, Node, Relationship, Path, List, Map> mData;
};

nlohmann::json toJson(const Node& node);
nlohmann::json toJson(const Relationship& relationship);
nlohmann::json toJson(const Path& path);

/// One result row: return alias -> value. Always a mapping, maybe empty.
using Row = std::map<std::string, Value>;

/// Rows produced by one statement, in server order.
struct QueryResult {
    std::vector<std::string> columns;
    std::vector<Row>         rows;

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
    const Row& operator[](std::size_t i) const { return rows[i]; }
    std::vector<Row>::const_iterator begin() const { return rows.begin(); }
    std::vector<Row>::const_iterator end() const { return rows.end(); }
};

/// One parameterized statement.
struct QueryDescriptor {
    std::string    query;
    nlohmann::json parameters = nlohmann::json::object();
    bool           lean       = false;
};

/// Ordered statements executed in one transaction.
using BatchRequest = std::vector<QueryDescriptor>;

} // namespace graph_http
