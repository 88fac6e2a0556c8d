#include "graph_client.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace graph_http {

namespace {

std::shared_ptr<const ClientConfig> validatedConfig(ClientConfig config) {
    // throws std::invalid_argument on a malformed endpoint
    auto endpoint = parseUrl(config.baseUrl);
    if (!endpoint.userInfo.empty()) {
        throw std::invalid_argument("Credentials in baseUrl " + redactUrl(config.baseUrl) +
                                    " are not sent; use ClientConfig::authorization");
    }
    if (config.timeout.count() <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }
    return std::make_shared<const ClientConfig>(std::move(config));
}

std::shared_ptr<Transport> checkedTransport(std::shared_ptr<Transport> transport) {
    if (!transport) {
        throw std::invalid_argument("GraphClient requires a transport");
    }
    return transport;
}

/// Callback that fulfils a promise; the future is the caller's handle.
template <typename Outcome>
std::pair<std::function<void(Outcome)>, std::future<Outcome>> promisedCallback() {
    auto promise = std::make_shared<std::promise<Outcome>>();
    auto future  = promise->get_future();
    return {[promise](Outcome outcome) { promise->set_value(std::move(outcome)); },
            std::move(future)};
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

GraphClient::GraphClient(ClientConfig config, std::shared_ptr<Transport> transport)
    : mConfig(validatedConfig(std::move(config)))
    , mExecutor(mConfig, checkedTransport(std::move(transport)))
{
    if (mConfig->verbose) {
        std::cerr << "[GraphClient] Endpoint " << redactUrl(mConfig->baseUrl)
                  << ", timeout " << mConfig->timeout.count() << " ms\n";
    }
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

void GraphClient::execute(const QueryDescriptor& descriptor,
                          const ExecuteOptions& options,
                          QueryCallback onDone) const {
    mExecutor.run(descriptor, options, std::move(onDone));
}

std::future<QueryOutcome> GraphClient::execute(const QueryDescriptor& descriptor,
                                               const ExecuteOptions& options) const {
    auto [callback, future] = promisedCallback<QueryOutcome>();
    mExecutor.run(descriptor, options, std::move(callback));
    return std::move(future);
}

void GraphClient::execute(const BatchRequest& batch,
                          const ExecuteOptions& options,
                          QueryCallback onDone) const {
    mExecutor.run(batch, options, std::move(onDone));
}

std::future<QueryOutcome> GraphClient::execute(const BatchRequest& batch,
                                               const ExecuteOptions& options) const {
    auto [callback, future] = promisedCallback<QueryOutcome>();
    mExecutor.run(batch, options, std::move(callback));
    return std::move(future);
}

void GraphClient::executeRaw(const BatchRequest& batch,
                             const ExecuteOptions& options,
                             RawCallback onDone) const {
    mExecutor.runRaw(batch, options, std::move(onDone));
}

std::future<RawOutcome> GraphClient::executeRaw(const BatchRequest& batch,
                                                const ExecuteOptions& options) const {
    auto [callback, future] = promisedCallback<RawOutcome>();
    mExecutor.runRaw(batch, options, std::move(callback));
    return std::move(future);
}

// ---------------------------------------------------------------------------
// Custom endpoints
// ---------------------------------------------------------------------------

void GraphClient::executeCustom(const CustomRequest& request,
                                const ExecuteOptions& options,
                                CustomCallback onDone) const {
    mExecutor.runCustom(request, options, std::move(onDone));
}

std::future<CustomOutcome> GraphClient::executeCustom(const CustomRequest& request,
                                                      const ExecuteOptions& options) const {
    auto [callback, future] = promisedCallback<CustomOutcome>();
    mExecutor.runCustom(request, options, std::move(callback));
    return std::move(future);
}

} // namespace graph_http
