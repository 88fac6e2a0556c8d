#include "batch_executor.hpp"
#include "hydrator.hpp"
#include "util.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace graph_http {

namespace {

ClassifierContext contextFor(const HttpRequest& request, std::size_t statementCount) {
    ClassifierContext context;
    context.method         = request.method;
    context.url            = request.url;
    context.statementCount = statementCount;
    return context;
}

ErrorRecord atStatement(const ErrorRecord& error, std::size_t index) {
    auto wrapped = error.withContext("Statement " + std::to_string(index));
    wrapped.statementIndex = index;
    return wrapped;
}

void logRequest(bool verbose, const HttpRequest& request, const std::string& what) {
    if (!verbose) {
        return;
    }
    std::cerr << "[BatchExecutor] " << request.method << " " << redactUrl(request.url)
              << " (" << what << ")\n"
              << "[BatchExecutor] Body: " << truncate(request.body, 300) << "\n";
}

void logFailure(bool verbose, const ErrorRecord& error) {
    if (verbose) {
        std::cerr << "[BatchExecutor] " << error.toString() << "\n";
    }
}

} // namespace

Result<std::vector<nlohmann::json>> extractStatementResults(const nlohmann::json& body,
                                                            std::size_t expected) {
    if (!body.is_object() || !body.contains("results") || !body["results"].is_array()) {
        return ErrorRecord::make(ErrorKind::Protocol, "Response missing 'results' array");
    }
    const auto& results = body["results"];
    if (results.size() != expected) {
        return ErrorRecord::make(ErrorKind::Protocol,
                                 "Expected " + std::to_string(expected) +
                                 " result sets, got " + std::to_string(results.size()));
    }
    return results.get<std::vector<nlohmann::json>>();
}

BatchExecutor::BatchExecutor(std::shared_ptr<const ClientConfig> config,
                             std::shared_ptr<Transport> transport)
    : mConfig(std::move(config))
    , mTransport(std::move(transport)) {}

// ---------------------------------------------------------------------------
// Single statement
// ---------------------------------------------------------------------------

void BatchExecutor::run(const QueryDescriptor& descriptor,
                        const ExecuteOptions& options,
                        QueryCallback onDone) const {
    const bool verbose = mConfig->verbose;
    auto request = buildStatementRequest(*mConfig, descriptor, options);
    if (!request) {
        logFailure(verbose, request.error());
        onDone(request.error());
        return;
    }

    logRequest(verbose, request.value(), "1 statement");
    auto context = contextFor(request.value(), 1);
    const bool lean = descriptor.lean;

    dispatch(std::move(request).value(), std::move(context),
             [verbose, lean, onDone = std::move(onDone)](Result<ClassifiedResponse> response) {
        if (!response) {
            logFailure(verbose, response.error());
            onDone(response.error());
            return;
        }
        auto hydrated = hydrateCypherResult(response.value().body, lean);
        if (!hydrated) {
            auto error = atStatement(hydrated.error(), 0);
            logFailure(verbose, error);
            onDone(error);
            return;
        }
        std::vector<QueryResult> results;
        results.push_back(std::move(hydrated).value());
        onDone(std::move(results));
    });
}

// ---------------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------------

void BatchExecutor::run(const BatchRequest& batch,
                        const ExecuteOptions& options,
                        QueryCallback onDone) const {
    const bool verbose = mConfig->verbose;
    auto request = buildBatchRequest(*mConfig, batch, options);
    if (!request) {
        logFailure(verbose, request.error());
        onDone(request.error());
        return;
    }

    logRequest(verbose, request.value(), std::to_string(batch.size()) + " statements");
    auto context = contextFor(request.value(), batch.size());

    std::vector<bool> leanFlags;
    leanFlags.reserve(batch.size());
    for (const auto& descriptor : batch) {
        leanFlags.push_back(descriptor.lean);
    }

    dispatch(std::move(request).value(), std::move(context),
             [verbose, leanFlags = std::move(leanFlags), onDone = std::move(onDone)](
                 Result<ClassifiedResponse> response) {
        if (!response) {
            logFailure(verbose, response.error());
            onDone(response.error());
            return;
        }

        auto statements = extractStatementResults(response.value().body, leanFlags.size());
        if (!statements) {
            logFailure(verbose, statements.error());
            onDone(statements.error());
            return;
        }

        // Hydrate everything before delivering anything.
        std::vector<QueryResult> results;
        results.reserve(leanFlags.size());
        for (std::size_t i = 0; i < leanFlags.size(); ++i) {
            auto hydrated = hydrateStatementResult(statements.value()[i], leanFlags[i]);
            if (!hydrated) {
                auto error = atStatement(hydrated.error(), i);
                logFailure(verbose, error);
                onDone(error);
                return;
            }
            results.push_back(std::move(hydrated).value());
        }
        onDone(std::move(results));
    });
}

void BatchExecutor::runRaw(const BatchRequest& batch,
                           const ExecuteOptions& options,
                           RawCallback onDone) const {
    const bool verbose = mConfig->verbose;
    auto request = buildBatchRequest(*mConfig, batch, options);
    if (!request) {
        logFailure(verbose, request.error());
        onDone(request.error());
        return;
    }

    logRequest(verbose, request.value(), std::to_string(batch.size()) + " statements, raw");
    auto context = contextFor(request.value(), batch.size());
    const auto expected = batch.size();

    dispatch(std::move(request).value(), std::move(context),
             [verbose, expected, onDone = std::move(onDone)](Result<ClassifiedResponse> response) {
        if (!response) {
            logFailure(verbose, response.error());
            onDone(response.error());
            return;
        }
        auto statements = extractStatementResults(response.value().body, expected);
        if (!statements) {
            logFailure(verbose, statements.error());
        }
        onDone(std::move(statements));
    });
}

// ---------------------------------------------------------------------------
// Custom endpoints
// ---------------------------------------------------------------------------

void BatchExecutor::runCustom(const CustomRequest& custom,
                              const ExecuteOptions& options,
                              CustomCallback onDone) const {
    const bool verbose = mConfig->verbose;
    auto request = buildCustomRequest(*mConfig, custom, options);
    if (!request) {
        logFailure(verbose, request.error());
        onDone(request.error());
        return;
    }

    logRequest(verbose, request.value(), "custom");
    auto context = contextFor(request.value(), 0);
    context.expectJson = false;

    dispatch(std::move(request).value(), std::move(context),
             [verbose, onDone = std::move(onDone)](Result<ClassifiedResponse> response) {
        if (!response) {
            logFailure(verbose, response.error());
        }
        onDone(std::move(response));
    });
}

// ---------------------------------------------------------------------------
// Transport hand-off
// ---------------------------------------------------------------------------

void BatchExecutor::dispatch(HttpRequest request,
                             ClassifierContext context,
                             ClassifiedHandler onClassified) const {
    auto settled = std::make_shared<std::atomic<bool>>(false);
    const bool verbose = mConfig->verbose;

    auto complete = [settled, verbose, context, onClassified](TransportOutcome outcome) {
        if (settled->exchange(true)) {
            if (verbose) {
                std::cerr << "[BatchExecutor] Dropping late completion for "
                          << context.method << " " << redactUrl(context.url) << "\n";
            }
            return;
        }
        onClassified(classify(outcome, context));
    };

    // Only a send() that fails before completing is a transport error.
    // Once the outcome is delivered, exceptions belong to the caller's callback.
    try {
        mTransport->send(std::move(request), complete);
    } catch (const std::exception& e) {
        if (settled->load()) {
            throw;
        }
        complete(TransportOutcome::failed(std::string("Transport rejected request: ") +
                                          e.what()));
    }
}

} // namespace graph_http
