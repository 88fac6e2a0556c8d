#pragma once

#include "util.hpp"

#include <chrono>
#include <string>

namespace graph_http {

/// Client configuration. Copied into the client at construction and never
/// modified afterwards.
struct ClientConfig {
    /// Database root, e.g. "http://localhost:7474". Endpoint paths are
    /// appended to it. Must not carry user-info ("user:pass@"); credentials
    /// go in authorization.
    std::string baseUrl = "http://localhost:7474";

    /// Pre-formatted Authorization header value ("Basic ...", "Bearer ...").
    /// Sent as a client-level header, never logged or stored in errors.
    std::string authorization;

    /// Client-level headers; override built-in defaults, overridden by
    /// per-call headers.
    HeaderMap headers;

    /// Default per-call timeout. Enforced by the transport only; see the
    /// Transport contract.
    std::chrono::milliseconds timeout{5000};

    bool verbose = false;
};

} // namespace graph_http
