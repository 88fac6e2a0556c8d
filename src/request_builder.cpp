#include "request_builder.hpp"
#include "endpoints.hpp"

#include <algorithm>
#include <cctype>

namespace graph_http {

namespace {

const char* const kUserAgent = "graph_http/1.0";

ErrorRecord invalidRequest(std::string message) {
    return ErrorRecord::make(ErrorKind::Protocol, std::move(message));
}

nlohmann::json normalizedParameters(const nlohmann::json& parameters) {
    return parameters.is_null() ? nlohmann::json::object() : parameters;
}

std::chrono::milliseconds effectiveTimeout(const ClientConfig& config,
                                           const ExecuteOptions& options) {
    return options.timeout.value_or(config.timeout);
}

HttpRequest makeRequest(const ClientConfig& config,
                        const ExecuteOptions& options,
                        std::string method,
                        const std::string& path,
                        std::string body) {
    HttpRequest request;
    request.method  = std::move(method);
    request.url     = joinUrl(config.baseUrl, path);
    request.headers = mergeHeaders(config, options.headers);
    request.body    = std::move(body);
    request.timeout = effectiveTimeout(config, options);
    return request;
}

} // namespace

HeaderMap defaultHeaders() {
    return {
        {"User-Agent", kUserAgent},
        {"Accept", "application/json; charset=UTF-8"},
        {"Content-Type", "application/json"},
        {"X-Stream", "true"}
    };
}

HeaderMap mergeHeaders(const ClientConfig& config, const HeaderMap& callHeaders) {
    HeaderMap merged = defaultHeaders();
    if (!config.authorization.empty()) {
        merged["Authorization"] = config.authorization;
    }
    for (const auto& [name, value] : config.headers) {
        merged[name] = value;
    }
    for (const auto& [name, value] : callHeaders) {
        merged[name] = value;
    }
    return merged;
}

std::optional<ErrorRecord> validateDescriptor(const QueryDescriptor& descriptor) {
    if (isBlank(descriptor.query)) {
        return invalidRequest("Missing query text");
    }
    if (!descriptor.parameters.is_null() && !descriptor.parameters.is_object()) {
        return invalidRequest(std::string("Parameters must be an object, got ") +
                              descriptor.parameters.type_name());
    }
    return std::nullopt;
}

Result<HttpRequest> buildStatementRequest(const ClientConfig& config,
                                          const QueryDescriptor& descriptor,
                                          const ExecuteOptions& options) {
    if (auto error = validateDescriptor(descriptor)) {
        return *error;
    }

    nlohmann::json payload;
    payload["query"]  = descriptor.query;
    payload["params"] = normalizedParameters(descriptor.parameters);

    return makeRequest(config, options, "POST", endpoints::kCypher, payload.dump());
}

Result<HttpRequest> buildBatchRequest(const ClientConfig& config,
                                      const BatchRequest& batch,
                                      const ExecuteOptions& options) {
    if (batch.empty()) {
        return invalidRequest("Batch contains no statements");
    }

    nlohmann::json statements = nlohmann::json::array();
    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (auto error = validateDescriptor(batch[i])) {
            error->statementIndex = i;
            return *error;
        }
        statements.push_back(nlohmann::json::object({
            {"statement", batch[i].query},
            {"parameters", normalizedParameters(batch[i].parameters)},
            {"resultDataContents", endpoints::kResultDataContents}
        }));
    }

    nlohmann::json payload;
    payload["statements"] = statements;

    return makeRequest(config, options, "POST", endpoints::kTransactionCommit,
                       payload.dump());
}

Result<HttpRequest> buildCustomRequest(const ClientConfig& config,
                                       const CustomRequest& request,
                                       const ExecuteOptions& options) {
    std::string method = request.method;
    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (method.empty() ||
        !std::all_of(method.begin(), method.end(),
                     [](unsigned char c) { return std::isalpha(c); })) {
        return invalidRequest("Invalid HTTP method: '" + request.method + "'");
    }
    if (isBlank(request.path)) {
        return invalidRequest("Missing request path");
    }

    ExecuteOptions merged = options;
    for (const auto& [name, value] : request.headers) {
        // per-call options win over the request's own headers
        merged.headers.emplace(name, value);
    }

    std::string body = request.body.is_null() ? std::string() : request.body.dump();
    return makeRequest(config, merged, std::move(method), request.path, std::move(body));
}

} // namespace graph_http
