#pragma once

#include "util.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>

namespace graph_http {

/// Fully prepared HTTP request handed to a Transport.
struct HttpRequest {
    std::string               method = "POST";
    std::string               url;      // absolute, may carry user-info
    HeaderMap                 headers;
    std::string               body;
    std::chrono::milliseconds timeout{5000};
};

/// What a Transport observed for one request.
struct TransportOutcome {
    enum class Status {
        Completed,  // a response arrived (any HTTP status)
        Failed,     // no response: connect/resolve/reset/write/read error
        TimedOut    // no response within HttpRequest::timeout
    };

    Status       status     = Status::Failed;
    unsigned int httpStatus = 0;
    HeaderMap    headers;
    std::string  body;
    std::string  errorMessage;
    bool         bodyTruncated = false;  // Completed, but the body hit the transport's size limit

    static TransportOutcome completed(unsigned int httpStatus,
                                      std::string body,
                                      HeaderMap headers = {});
    static TransportOutcome failed(std::string message);
    static TransportOutcome timedOut(std::string message);
};

inline TransportOutcome TransportOutcome::completed(unsigned int httpStatus,
                                                    std::string body,
                                                    HeaderMap headers) {
    TransportOutcome outcome;
    outcome.status     = Status::Completed;
    outcome.httpStatus = httpStatus;
    outcome.body       = std::move(body);
    outcome.headers    = std::move(headers);
    return outcome;
}

inline TransportOutcome TransportOutcome::failed(std::string message) {
    TransportOutcome outcome;
    outcome.status       = Status::Failed;
    outcome.errorMessage = std::move(message);
    return outcome;
}

inline TransportOutcome TransportOutcome::timedOut(std::string message) {
    TransportOutcome outcome;
    outcome.status       = Status::TimedOut;
    outcome.errorMessage = std::move(message);
    return outcome;
}

/// Network I/O capability injected into GraphClient.
///
/// send() must not block: it starts the request and returns. The
/// completion handler is invoked later, possibly on another thread, and
/// should be invoked once per request.
///
/// The client keeps no timers of its own. An implementation must complete
/// every request it accepts: with a response, with Failed, or with TimedOut
/// once HttpRequest::timeout has elapsed. A request that is never completed
/// leaves its callback uncalled and its future pending forever.
class Transport {
public:
    using CompletionHandler = std::function<void(TransportOutcome)>;

    virtual ~Transport() = default;

    virtual void send(HttpRequest request, CompletionHandler onComplete) = 0;
};

} // namespace graph_http
