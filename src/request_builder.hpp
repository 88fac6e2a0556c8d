#pragma once

#include "config.hpp"
#include "models.hpp"
#include "result.hpp"
#include "transport.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace graph_http {

/// Per-call settings.
struct ExecuteOptions {
    HeaderMap                                headers;  // highest precedence
    std::optional<std::chrono::milliseconds> timeout;  // overrides ClientConfig::timeout
};

/// Request to a non-statement endpoint (server plugins, management APIs).
struct CustomRequest {
    std::string    method = "GET";
    std::string    path;           // relative to baseUrl, or absolute URL
    nlohmann::json body;           // null -> no body
    HeaderMap      headers;        // merged like ExecuteOptions::headers
};

/// Headers every request starts from.
HeaderMap defaultHeaders();

/// defaults < client config (incl. Authorization) < @p callHeaders.
HeaderMap mergeHeaders(const ClientConfig& config, const HeaderMap& callHeaders);

/// Check one statement; the error is a Protocol record.
std::optional<ErrorRecord> validateDescriptor(const QueryDescriptor& descriptor);

/// Single-statement fast path against the cypher endpoint.
Result<HttpRequest> buildStatementRequest(const ClientConfig& config,
                                          const QueryDescriptor& descriptor,
                                          const ExecuteOptions& options);

/// All statements in one transaction-commit request. Accepts N >= 1.
Result<HttpRequest> buildBatchRequest(const ClientConfig& config,
                                      const BatchRequest& batch,
                                      const ExecuteOptions& options);

Result<HttpRequest> buildCustomRequest(const ClientConfig& config,
                                       const CustomRequest& request,
                                       const ExecuteOptions& options);

} // namespace graph_http
