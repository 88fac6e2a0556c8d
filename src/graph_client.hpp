#pragma once

#include "batch_executor.hpp"
#include "config.hpp"
#include "models.hpp"
#include "request_builder.hpp"
#include "result.hpp"
#include "transport.hpp"

#include <future>
#include <memory>

namespace graph_http {

/// Public entry point: submits statements and custom requests through an
/// injected Transport and reports one outcome per call.
///
/// Calls never block: the callback forms return as soon as the request is
/// handed to the transport, the future forms return a future that becomes
/// ready on completion. Configuration is fixed at construction and shared
/// read-only by all in-flight calls, so one client may be used from many
/// threads at once.
class GraphClient {
public:
    /// @throws std::invalid_argument if baseUrl is malformed or carries
    ///         user-info, the timeout is not positive, or transport is null.
    GraphClient(ClientConfig config, std::shared_ptr<Transport> transport);

    /// Run one statement. On success the outcome holds exactly one QueryResult.
    void execute(const QueryDescriptor& descriptor,
                 const ExecuteOptions& options,
                 QueryCallback onDone) const;
    std::future<QueryOutcome> execute(const QueryDescriptor& descriptor,
                                      const ExecuteOptions& options = {}) const;

    /// Run all statements in one transaction. On success the outcome holds
    /// one QueryResult per statement, in request order; on any failure it
    /// holds an ErrorRecord and no results.
    void execute(const BatchRequest& batch,
                 const ExecuteOptions& options,
                 QueryCallback onDone) const;
    std::future<QueryOutcome> execute(const BatchRequest& batch,
                                      const ExecuteOptions& options = {}) const;

    /// Like execute(batch) without hydration: each element is the server's
    /// {"columns": [...], "data": [...]} for that statement.
    void executeRaw(const BatchRequest& batch,
                    const ExecuteOptions& options,
                    RawCallback onDone) const;
    std::future<RawOutcome> executeRaw(const BatchRequest& batch,
                                       const ExecuteOptions& options = {}) const;

    /// Arbitrary request to a non-statement endpoint. A body that is not
    /// JSON is returned as raw text (CustomResponse::structured == false).
    void executeCustom(const CustomRequest& request,
                       const ExecuteOptions& options,
                       CustomCallback onDone) const;
    std::future<CustomOutcome> executeCustom(const CustomRequest& request,
                                             const ExecuteOptions& options = {}) const;

    const ClientConfig& config() const { return *mConfig; }

private:
    std::shared_ptr<const ClientConfig> mConfig;
    BatchExecutor                       mExecutor;
};

} // namespace graph_http
