/// @file test_batch_executor.cpp
/// Unit tests for batch_executor.hpp, driven by a scripted transport.

#include "batch_executor.hpp"
#include "endpoints.hpp"
#include "fake_transport.hpp"
#include "response_fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <stdexcept>

using namespace graph_http;
using graph_http::fakes::ScriptedTransport;
using graph_http::fakes::ThrowingTransport;
using json = nlohmann::json;

namespace {

/// Node in REST format, as both endpoints return it for the requests built here.
json nodeJson(std::int64_t id, const std::string& label, json properties) {
    std::string self = "http://localhost:7474/db/data/node/" + std::to_string(id);
    return {{"self", self},
            {"labels", self + "/labels"},
            {"properties", self + "/properties"},
            {"metadata", {{"id", id}, {"labels", json::array({label})}}},
            {"data", std::move(properties)}};
}

json rowResult(std::vector<std::string> columns, std::vector<json> rows) {
    json data = json::array();
    for (auto& row : rows) {
        data.push_back(json::object({
            {"rest", std::move(row)},
            {"graph", {{"nodes", json::array()}, {"relationships", json::array()}}}
        }));
    }
    return {{"columns", columns}, {"data", data}};
}

json commitBody(std::vector<json> results) {
    return {{"results", results}, {"errors", json::array()}};
}

struct Fixture {
    std::shared_ptr<ScriptedTransport> transport;
    BatchExecutor                      executor;

    explicit Fixture(bool deferred = false)
        : transport(std::make_shared<ScriptedTransport>(deferred))
        , executor(std::make_shared<const ClientConfig>(), transport) {}
};

/// Captures every callback invocation.
template <typename Outcome>
struct Capture {
    int                    calls = 0;
    std::optional<Outcome> outcome;

    std::function<void(Outcome)> callback() {
        return [this](Outcome result) {
            ++calls;
            outcome.emplace(std::move(result));
        };
    }
};

} // namespace

// ============================================================================
// Single statement
// ============================================================================

TEST(BatchExecutorSingle, HydratesCypherRows) {
    Fixture f;
    json body = {{"columns", {"u", "age"}},
                 {"data", json::array({json::array({nodeJson(7, "User", {{"name", "Alice"}}), 30})})}};
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"MATCH (u:User) RETURN u, u.age AS age"}, {},
                   capture.callback());

    ASSERT_EQ(capture.calls, 1);
    ASSERT_TRUE(capture.outcome->ok());
    const auto& results = capture.outcome->value();
    ASSERT_EQ(results.size(), 1u);
    ASSERT_EQ(results[0].size(), 1u);
    EXPECT_TRUE(results[0][0].at("u").isNode());
    EXPECT_EQ(results[0][0].at("u").asNode().id, 7);
    EXPECT_EQ(results[0][0].at("age").asScalar(), 30);

    auto requests = f.transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "http://localhost:7474" + endpoints::kCypher);
}

TEST(BatchExecutorSingle, LeanReturnsPropertyMaps) {
    Fixture f;
    json body = {{"columns", {"u"}},
                 {"data", json::array({json::array({nodeJson(7, "User", {{"name", "Alice"}})})})}};
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"MATCH (u) RETURN u", json::object(), true}, {},
                   capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    const auto& u = capture.outcome->value()[0][0].at("u");
    ASSERT_TRUE(u.isMap());
    EXPECT_EQ(u.asMap().at("name").asScalar(), "Alice");
}

TEST(BatchExecutorSingle, CypherEndpointResponse) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(200, fixtures::kCypherNodeRelPath));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"MATCH p = (a)-[r:KNOWS]->(b) RETURN a, r, p"}, {},
                   capture.callback());

    ASSERT_TRUE(capture.outcome->ok()) << capture.outcome->error().toString();
    const auto& row = capture.outcome->value()[0][0];
    ASSERT_TRUE(row.at("a").isNode());
    EXPECT_EQ(row.at("a").asNode().properties, json({{"name", "Alice"}}));
    ASSERT_TRUE(row.at("r").isRelationship());
    EXPECT_EQ(row.at("r").asRelationship().type, "KNOWS");
    ASSERT_TRUE(row.at("p").isPath());
    EXPECT_EQ(row.at("p").asPath().end().id, 8);
}

TEST(BatchExecutorSingle, LeanCypherEndpointResponse) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(200, fixtures::kCypherNodeRelPath));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"MATCH p = (a)-[r:KNOWS]->(b) RETURN a, r, p",
                                   json::object(), true},
                   {}, capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    const auto& a = capture.outcome->value()[0][0].at("a");
    ASSERT_TRUE(a.isMap());
    EXPECT_EQ(a.asMap().size(), 1u);
    EXPECT_EQ(a.asMap().at("name").asScalar(), "Alice");
}

TEST(BatchExecutorSingle, MalformedRowIsProtocolAtStatementZero) {
    Fixture f;
    json body = {{"columns", {"a", "b"}}, {"data", json::array({json::array({1})})}};
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"RETURN 1 AS a, 2 AS b"}, {}, capture.callback());

    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Protocol);
    EXPECT_EQ(capture.outcome->error().statementIndex.value(), 0u);
    ASSERT_TRUE(capture.outcome->error().cause);
}

TEST(BatchExecutorSingle, InvalidDescriptorNeverReachesTransport) {
    Fixture f;
    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{""}, {}, capture.callback());

    ASSERT_EQ(capture.calls, 1);
    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Protocol);
    EXPECT_TRUE(f.transport->requests().empty());
}

// ============================================================================
// Batch
// ============================================================================

TEST(BatchExecutorBatch, ResultsAreIndexAlignedWithRequest) {
    Fixture f;
    json body = commitBody({
        rowResult({"n"}, {json::array({nodeJson(1, "A", json::object())})}),
        rowResult({"n"}, {json::array({nodeJson(2, "B", json::object())})}),
        rowResult({"count"}, {json::array({2})})
    });
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    BatchRequest batch = {
        {"CREATE (n:A) RETURN n", json::object()},
        {"CREATE (n:B) RETURN n", json::object()},
        {"MATCH (n) RETURN count(n) AS count", json::object()}
    };

    Capture<QueryOutcome> capture;
    f.executor.run(batch, {}, capture.callback());

    ASSERT_EQ(capture.calls, 1);
    ASSERT_TRUE(capture.outcome->ok());
    const auto& results = capture.outcome->value();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0][0].at("n").asNode().hasLabel("A"));
    EXPECT_TRUE(results[1][0].at("n").asNode().hasLabel("B"));
    EXPECT_EQ(results[2][0].at("count").asScalar(), 2);

    auto requests = f.transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "http://localhost:7474" + endpoints::kTransactionCommit);
}

TEST(BatchExecutorBatch, LeanIsPerStatement) {
    Fixture f;
    json body = commitBody({
        rowResult({"n"}, {json::array({nodeJson(1, "A", {{"k", 1}})})}),
        rowResult({"n"}, {json::array({nodeJson(1, "A", {{"k", 1}})})})
    });
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    BatchRequest batch = {
        {"MATCH (n) RETURN n", json::object(), true},
        {"MATCH (n) RETURN n", json::object(), false}
    };

    Capture<QueryOutcome> capture;
    f.executor.run(batch, {}, capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    EXPECT_TRUE(capture.outcome->value()[0][0].at("n").isMap());
    EXPECT_TRUE(capture.outcome->value()[1][0].at("n").isNode());
}

TEST(BatchExecutorBatch, CommitEndpointResponse) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(200, fixtures::kCommitRestAndGraph));

    Capture<QueryOutcome> capture;
    f.executor.run(BatchRequest{{"MATCH p = (a)-[:KNOWS]->(b) RETURN a, p", json::object()}},
                   {}, capture.callback());

    ASSERT_TRUE(capture.outcome->ok()) << capture.outcome->error().toString();
    const auto& row = capture.outcome->value()[0][0];
    EXPECT_EQ(row.at("a").asNode().id, 7);
    const auto& path = row.at("p").asPath();
    EXPECT_EQ(path.end().properties, json({{"name", "Bob"}}));
    EXPECT_EQ(path.relationships[0].type, "KNOWS");
}

TEST(BatchExecutorBatch, LeanCommitEndpointResponse) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(200, fixtures::kCommitRestAndGraph));

    Capture<QueryOutcome> capture;
    f.executor.run(BatchRequest{{"MATCH p = (a)-[:KNOWS]->(b) RETURN a, p",
                                 json::object(), true}},
                   {}, capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    const auto& row = capture.outcome->value()[0][0];
    EXPECT_EQ(row.at("a").asMap().at("name").asScalar(), "Alice");
    const auto& segments = row.at("p").asList();
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[2].asMap().at("name").asScalar(), "Bob");
}

TEST(BatchExecutorBatch, DatabaseErrorDeliversNoResults) {
    Fixture f;
    json body = {
        {"results", json::array({rowResult({"n"}, {})})},
        {"errors", {{{"code", "Neo.ClientError.Statement.SyntaxError"},
                     {"message", "Invalid input"}}}}
    };
    f.transport->enqueue(TransportOutcome::completed(200, body.dump()));

    BatchRequest batch = {{"RETURN 1", json::object()}, {"RETRN 2", json::object()}};
    Capture<QueryOutcome> capture;
    f.executor.run(batch, {}, capture.callback());

    ASSERT_EQ(capture.calls, 1);
    ASSERT_FALSE(capture.outcome->ok());
    const auto& error = capture.outcome->error();
    EXPECT_EQ(error.kind, ErrorKind::ClientRequest);
    EXPECT_EQ(error.code.value(), "Neo.ClientError.Statement.SyntaxError");
    EXPECT_EQ(error.statementIndex.value(), 1u);
}

TEST(BatchExecutorBatch, ResultCountMismatchIsProtocol) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(
        200, commitBody({rowResult({"x"}, {json::array({1})})}).dump()));

    BatchRequest batch = {{"RETURN 1 AS x", json::object()}, {"RETURN 2 AS x", json::object()}};
    Capture<QueryOutcome> capture;
    f.executor.run(batch, {}, capture.callback());

    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Protocol);
}

TEST(BatchExecutorBatch, HydrationFailureNamesTheStatement) {
    Fixture f;
    json broken = {{"columns", {"x"}}, {"data", json::array({{{"neither", 1}}})}};
    f.transport->enqueue(TransportOutcome::completed(
        200, commitBody({rowResult({"x"}, {json::array({1})}), broken}).dump()));

    BatchRequest batch = {{"RETURN 1 AS x", json::object()}, {"RETURN 2 AS x", json::object()}};
    Capture<QueryOutcome> capture;
    f.executor.run(batch, {}, capture.callback());

    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Protocol);
    EXPECT_EQ(capture.outcome->error().statementIndex.value(), 1u);
    EXPECT_NE(capture.outcome->error().message.find("Statement 1"), std::string::npos);
}

TEST(BatchExecutorBatch, EmptyBatchNeverReachesTransport) {
    Fixture f;
    Capture<QueryOutcome> capture;
    f.executor.run(BatchRequest{}, {}, capture.callback());

    ASSERT_EQ(capture.calls, 1);
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Protocol);
    EXPECT_TRUE(f.transport->requests().empty());
}

// ============================================================================
// Single terminal outcome
// ============================================================================

TEST(BatchExecutorOutcome, DuplicateCompletionsInvokeCallbackOnce) {
    Fixture f;
    f.transport->setDuplicateCompletions(true);
    f.transport->enqueue(TransportOutcome::completed(
        200, commitBody({rowResult({"x"}, {json::array({1})})}).dump()));

    Capture<QueryOutcome> capture;
    f.executor.run(BatchRequest{{"RETURN 1 AS x", json::object()}}, {}, capture.callback());

    EXPECT_EQ(capture.calls, 1);
    EXPECT_TRUE(capture.outcome->ok());
}

TEST(BatchExecutorOutcome, ThrowingTransportBecomesTransportError) {
    auto config = std::make_shared<const ClientConfig>();
    BatchExecutor executor(config, std::make_shared<ThrowingTransport>());

    Capture<QueryOutcome> capture;
    executor.run(QueryDescriptor{"RETURN 1"}, {}, capture.callback());

    ASSERT_EQ(capture.calls, 1);
    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Transport);
    EXPECT_NE(capture.outcome->error().message.find("socket pool exhausted"), std::string::npos);
}

TEST(BatchExecutorOutcome, CallbackExceptionReachesTheCaller) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(
        200, json({{"columns", {"x"}}, {"data", json::array({json::array({1})})}}).dump()));

    int calls = 0;
    auto throwing = [&calls](QueryOutcome) {
        ++calls;
        throw std::runtime_error("callback failed");
    };

    EXPECT_THROW(f.executor.run(QueryDescriptor{"RETURN 1 AS x"}, {}, throwing),
                 std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST(BatchExecutorOutcome, TimeoutIsDeliveredAsTimeout) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::timedOut("read timed out"));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"RETURN 1"}, {}, capture.callback());

    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::Timeout);
}

TEST(BatchExecutorOutcome, DeferredCompletionArrivesLater) {
    Fixture f(/*deferred=*/true);
    f.transport->enqueue(TransportOutcome::completed(
        200, json({{"columns", {"x"}}, {"data", json::array({json::array({1})})}}).dump()));

    Capture<QueryOutcome> capture;
    f.executor.run(QueryDescriptor{"RETURN 1 AS x"}, {}, capture.callback());
    EXPECT_EQ(capture.calls, 0);
    ASSERT_EQ(f.transport->pendingCount(), 1u);

    f.transport->completePending(0);
    EXPECT_EQ(capture.calls, 1);
    EXPECT_TRUE(capture.outcome->ok());

    // a second completion of the same request is dropped
    f.transport->completePending(0);
    EXPECT_EQ(capture.calls, 1);
}

// ============================================================================
// Raw and custom
// ============================================================================

TEST(BatchExecutorRaw, ReturnsUnhydratedStatementResults) {
    Fixture f;
    auto first = rowResult({"n"}, {json::array({nodeJson(1, "A", json::object())})});
    f.transport->enqueue(TransportOutcome::completed(200, commitBody({first}).dump()));

    Capture<RawOutcome> capture;
    f.executor.runRaw(BatchRequest{{"MATCH (n) RETURN n", json::object()}}, {},
                      capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    ASSERT_EQ(capture.outcome->value().size(), 1u);
    EXPECT_EQ(capture.outcome->value()[0], first);
}

TEST(BatchExecutorCustom, PassesThroughPlainTextBody) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(200, "OK"));

    CustomRequest request;
    request.path = "/db/manage/server/jmx/";

    Capture<CustomOutcome> capture;
    f.executor.runCustom(request, {}, capture.callback());

    ASSERT_TRUE(capture.outcome->ok());
    EXPECT_FALSE(capture.outcome->value().structured);
    EXPECT_EQ(capture.outcome->value().rawBody, "OK");
    EXPECT_EQ(f.transport->requests()[0].method, "GET");
}

TEST(BatchExecutorCustom, ServerErrorIsClassified) {
    Fixture f;
    f.transport->enqueue(TransportOutcome::completed(503, "unavailable"));

    CustomRequest request;
    request.path = "/db/data/ext/Plugin";

    Capture<CustomOutcome> capture;
    f.executor.runCustom(request, {}, capture.callback());

    ASSERT_FALSE(capture.outcome->ok());
    EXPECT_EQ(capture.outcome->error().kind, ErrorKind::ServerInternal);
}

// ============================================================================
// extractStatementResults
// ============================================================================

TEST(ExtractStatementResults, MissingResultsIsProtocol) {
    auto extracted = extractStatementResults(json::object(), 1);
    ASSERT_FALSE(extracted.ok());
    EXPECT_EQ(extracted.error().kind, ErrorKind::Protocol);
}

TEST(ExtractStatementResults, ExactCountSucceeds) {
    auto extracted = extractStatementResults(
        commitBody({rowResult({"a"}, {}), rowResult({"b"}, {})}), 2);
    ASSERT_TRUE(extracted.ok());
    EXPECT_EQ(extracted.value().size(), 2u);
}
