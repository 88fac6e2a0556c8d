#pragma once

#include "transport.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace graph_http {

/// Asynchronous HTTP/1.1 transport built on Boost.Beast.
///
/// Requests run on an internal io_context serviced by worker threads, so
/// send() returns immediately. At most Options::maxConnections requests are
/// on the wire at once; the rest wait in FIFO order. Destruction fails queued
/// requests and waits for in-flight ones, except when it happens inside a
/// completion handler: then the workers finish the in-flight requests and
/// release the internal state themselves.
class BeastTransport final : public Transport {
public:
    struct Options {
        /// Plain HTTP proxy, e.g. "http://proxy.local:3128". Empty = direct.
        std::string proxy;
        std::size_t maxConnections = 16;
        /// Larger response bodies complete with bodyTruncated set.
        std::size_t maxResponseBytes = 64 * 1024 * 1024;
        std::size_t threads        = 1;
        bool        verbose        = false;
    };

    /// @throws std::invalid_argument on a malformed proxy URL or zero limits.
    explicit BeastTransport(Options options);
    BeastTransport();
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    void send(HttpRequest request, CompletionHandler onComplete) override;

private:
    struct Impl;
    std::shared_ptr<Impl> mImpl;
};

} // namespace graph_http
