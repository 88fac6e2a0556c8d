#pragma once

#include "result.hpp"
#include "transport.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace graph_http {

/// Request facts the classifier may attach to an ErrorRecord.
struct ClassifierContext {
    std::string method;              // "POST"
    std::string url;                 // redacted before use
    bool        expectJson     = true;
    std::size_t statementCount = 0;  // 0 for non-statement requests
};

/// A response that passed classification.
struct ClassifiedResponse {
    unsigned int   httpStatus = 0;
    nlohmann::json body;           // parsed body, or the raw text as a JSON string
    std::string    rawBody;
    bool           structured = false;
};

/// Bytes of response body kept in ErrorRecord::responseExcerpt.
constexpr std::size_t kResponseExcerptBytes = 512;

/// Turn one transport outcome into success or exactly one ErrorRecord.
/// Checks, first match wins: Transport, Timeout, ClientRequest,
/// Authentication, ServerInternal, Protocol, success.
Result<ClassifiedResponse> classify(const TransportOutcome& outcome,
                                    const ClassifierContext& context);

/// Kind implied by a database status code such as
/// "Neo.ClientError.Statement.SyntaxError".
ErrorKind kindForDatabaseCode(const std::string& code);

} // namespace graph_http
