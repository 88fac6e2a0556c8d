#pragma once

#include <string>
#include <vector>

namespace graph_http {
namespace endpoints {

/// Single-statement endpoint.
/// Body: {"query": "...", "params": {...}}
/// Response: {"columns": [...], "data": [[...], ...]}
/// Values come back in REST format. Paths only carry entity URLs here.
inline const std::string kCypher = "/db/data/cypher";

/// Open, run and commit a transaction in one round trip.
/// Body: {"statements": [{"statement": "...", "parameters": {...},
///                        "resultDataContents": [...]}, ...]}
/// Response: {"results": [{"columns": [...], "data": [{"rest": [...], "graph": {...}}]}],
///            "errors": [...]}
/// Any statement error rolls the whole transaction back.
inline const std::string kTransactionCommit = "/db/data/transaction/commit";

/// Requested per statement on the commit endpoint. "rest" keeps entity
/// identity and labels in each row; "graph" lets path URLs resolve to
/// full entities.
inline const std::vector<std::string> kResultDataContents = {"rest", "graph"};

} // namespace endpoints
} // namespace graph_http
