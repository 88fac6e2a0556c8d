#pragma once

#include "classifier.hpp"
#include "config.hpp"
#include "models.hpp"
#include "request_builder.hpp"
#include "result.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

namespace graph_http {

using CustomResponse = ClassifiedResponse;

using QueryOutcome  = Result<std::vector<QueryResult>>;
using RawOutcome    = Result<std::vector<nlohmann::json>>;
using CustomOutcome = Result<CustomResponse>;

using QueryCallback  = std::function<void(QueryOutcome)>;
using RawCallback    = std::function<void(RawOutcome)>;
using CustomCallback = std::function<void(CustomOutcome)>;

/// Runs one call from request building to a single terminal outcome.
///
/// A batch is sent to the transaction-commit endpoint, so the server runs
/// all statements in one transaction and rolls back on any error. The
/// executor only ever delivers all N results or one ErrorRecord. Nothing is
/// retried. Holds no per-call state; each call owns its own latch.
class BatchExecutor {
public:
    BatchExecutor(std::shared_ptr<const ClientConfig> config,
                  std::shared_ptr<Transport> transport);

    /// Single-statement fast path (cypher endpoint). Yields one QueryResult.
    void run(const QueryDescriptor& descriptor,
             const ExecuteOptions& options,
             QueryCallback onDone) const;

    /// Transactional batch, N >= 1. Yields N QueryResults in request order.
    void run(const BatchRequest& batch,
             const ExecuteOptions& options,
             QueryCallback onDone) const;

    /// As the batch run, but yields each statement's {columns, data} unhydrated.
    void runRaw(const BatchRequest& batch,
                const ExecuteOptions& options,
                RawCallback onDone) const;

    void runCustom(const CustomRequest& request,
                   const ExecuteOptions& options,
                   CustomCallback onDone) const;

private:
    using ClassifiedHandler = std::function<void(Result<ClassifiedResponse>)>;

    /// Send @p request and classify the first completion; later completions
    /// are dropped.
    void dispatch(HttpRequest request,
                  ClassifierContext context,
                  ClassifiedHandler onClassified) const;

    std::shared_ptr<const ClientConfig> mConfig;
    std::shared_ptr<Transport>          mTransport;
};

/// Split a successful transaction-commit body into exactly @p expected
/// statement results.
Result<std::vector<nlohmann::json>> extractStatementResults(const nlohmann::json& body,
                                                            std::size_t expected);

} // namespace graph_http
