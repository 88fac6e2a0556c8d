#include "beast_transport.hpp"
#include "util.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef GRAPH_HTTP_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace graph_http {

namespace {

using Strand = net::strand<net::io_context::executor_type>;

/// Everything a session needs to run one request.
struct Job {
    HttpRequest                  request;
    Transport::CompletionHandler onComplete;
    std::function<void()>        onRelease;
    std::string                  connectHost;  // origin or proxy
    std::string                  connectPort;
    std::string                  host;         // origin, for Host and SNI
    std::string                  hostHeader;
    std::string                  target;       // origin-form, or absolute-form via proxy
    std::uint64_t                maxResponseBytes = 0;
    bool                         verbose = false;
};

template <typename Stream>
struct IsTlsStream : std::false_type {};

#ifdef GRAPH_HTTP_HAS_SSL
template <>
struct IsTlsStream<beast::ssl_stream<beast::tcp_stream>> : std::true_type {};
#endif

void complete(Job& job, TransportOutcome outcome) {
    auto onComplete = std::move(job.onComplete);
    auto onRelease  = std::move(job.onRelease);
    onRelease();
    try {
        onComplete(std::move(outcome));
    } catch (const std::exception& e) {
        std::cerr << "[BeastTransport] Completion handler threw: " << e.what() << "\n";
    }
}

// ---------------------------------------------------------------------------
// Session: resolve -> connect -> [handshake] -> write -> read
// ---------------------------------------------------------------------------

template <typename Stream>
class Session : public std::enable_shared_from_this<Session<Stream>> {
public:
    template <typename... StreamArgs>
    Session(Job job, const Strand& strand, StreamArgs&&... streamArgs)
        : mJob(std::move(job))
        , mResolver(strand)
        , mResolveTimer(strand)
        , mStream(strand, std::forward<StreamArgs>(streamArgs)...) {}

    /// Start on the session's strand; send() may be called from any thread.
    void run() {
        net::dispatch(mResolver.get_executor(),
                      beast::bind_front_handler(&Session::begin, this->shared_from_this()));
    }

private:
    Job                                mJob;
    tcp::resolver                      mResolver;
    net::steady_timer                  mResolveTimer;
    Stream                             mStream;
    beast::flat_buffer                 mBuffer;
    http::request<http::string_body>   mRequest;
    http::response_parser<http::string_body> mParser;
    std::chrono::steady_clock::time_point mDeadline;
    bool                               mResolveExpired = false;

    beast::tcp_stream& lowest() { return beast::get_lowest_layer(mStream); }

    void begin() {
        mDeadline = std::chrono::steady_clock::now() + mJob.request.timeout;

        // tcp_stream expiry covers connect/write/read; resolve needs its own timer.
        auto self = this->shared_from_this();
        mResolveTimer.expires_at(mDeadline);
        mResolveTimer.async_wait([self](beast::error_code ec) {
            if (!ec) {
                self->mResolveExpired = true;
                self->mResolver.cancel();
            }
        });

        mResolver.async_resolve(
            mJob.connectHost, mJob.connectPort,
            beast::bind_front_handler(&Session::onResolve, self));
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        mResolveTimer.cancel();
        if (mResolveExpired) {
            return finish(TransportOutcome::timedOut("Resolve timed out for " + mJob.connectHost));
        }
        if (ec) {
            return fail(ec, "resolve");
        }

        lowest().expires_at(mDeadline);
        lowest().async_connect(
            results,
            beast::bind_front_handler(&Session::onConnect, this->shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail(ec, "connect");
        }
#ifdef GRAPH_HTTP_HAS_SSL
        if constexpr (IsTlsStream<Stream>::value) {
            // SNI hostname.
            if (!SSL_set_tlsext_host_name(mStream.native_handle(), mJob.host.c_str())) {
                return finish(TransportOutcome::failed("Failed to set SNI hostname"));
            }
            mStream.async_handshake(
                net::ssl::stream_base::client,
                beast::bind_front_handler(&Session::onHandshake, this->shared_from_this()));
            return;
        }
#endif
        write();
    }

#ifdef GRAPH_HTTP_HAS_SSL
    void onHandshake(beast::error_code ec) {
        if (ec) {
            return fail(ec, "handshake");
        }
        write();
    }
#endif

    void write() {
        auto verb = http::string_to_verb(mJob.request.method);
        if (verb == http::verb::unknown) {
            return finish(TransportOutcome::failed("Unsupported HTTP method " +
                                                   mJob.request.method));
        }

        mRequest.method(verb);
        mRequest.target(mJob.target);
        mRequest.version(11);
        mRequest.set(http::field::host, mJob.hostHeader);
        for (const auto& [name, value] : mJob.request.headers) {
            mRequest.set(name, value);
        }
        mRequest.body() = mJob.request.body;
        mRequest.prepare_payload();

        lowest().expires_at(mDeadline);
        http::async_write(
            mStream, mRequest,
            beast::bind_front_handler(&Session::onWrite, this->shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            return fail(ec, "write");
        }
        mParser.body_limit(mJob.maxResponseBytes);
        http::async_read(
            mStream, mBuffer, mParser,
            beast::bind_front_handler(&Session::onRead, this->shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        // An oversized body still means the server answered.
        const bool overLimit = ec == http::error::body_limit && mParser.is_header_done();
        if (ec && !overLimit) {
            return fail(ec, "read");
        }

        auto& response = mParser.get();
        HeaderMap headers;
        for (const auto& field : response) {
            headers[std::string(field.name_string())] = std::string(field.value());
        }
        auto outcome = TransportOutcome::completed(response.result_int(),
                                                   std::move(response.body()),
                                                   std::move(headers));
        if (overLimit) {
            outcome.bodyTruncated = true;
            outcome.errorMessage  = "Response body exceeds " +
                                    std::to_string(mJob.maxResponseBytes) + " bytes";
        }

        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code ignored;
        lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);

        finish(std::move(outcome));
    }

    void fail(beast::error_code ec, const char* what) {
        if (ec == beast::error::timeout) {
            return finish(TransportOutcome::timedOut(std::string(what) + " timed out after " +
                                                     std::to_string(mJob.request.timeout.count()) +
                                                     " ms"));
        }
        finish(TransportOutcome::failed(std::string(what) + ": " + ec.message()));
    }

    void finish(TransportOutcome outcome) {
        if (mJob.verbose) {
            if (outcome.status == TransportOutcome::Status::Completed) {
                std::cerr << "[BeastTransport] HTTP " << outcome.httpStatus << " from "
                          << mJob.host
                          << (outcome.bodyTruncated ? " (" + outcome.errorMessage + ")" : "")
                          << "\n";
            } else {
                std::cerr << "[BeastTransport] " << outcome.errorMessage << " ("
                          << mJob.host << ")\n";
            }
        }
        complete(mJob, std::move(outcome));
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Impl: io_context, worker threads, connection limit
// ---------------------------------------------------------------------------

struct BeastTransport::Impl : std::enable_shared_from_this<BeastTransport::Impl> {
    struct Pending {
        HttpRequest       request;
        CompletionHandler onComplete;
    };

    Options                                                   options;
    std::optional<UrlParts>                                   proxy;
    net::io_context                                           ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
#ifdef GRAPH_HTTP_HAS_SSL
    net::ssl::context                                         sslContext{net::ssl::context::tlsv12_client};
#endif
    std::vector<std::thread>                                  threads;

    std::mutex          mutex;
    std::size_t         active   = 0;
    std::deque<Pending> queue;
    bool                stopping = false;

    explicit Impl(Options opts)
        : options(std::move(opts))
        , ioc(static_cast<int>(options.threads))
        , work(net::make_work_guard(ioc))
    {
        if (!options.proxy.empty()) {
            proxy = parseUrl(options.proxy);
            if (proxy->scheme != "http") {
                throw std::invalid_argument("Only plain HTTP proxies are supported");
            }
        }
#ifdef GRAPH_HTTP_HAS_SSL
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(net::ssl::verify_peer);
#endif
    }

    /// Workers, pending handlers and sessions each hold a reference, so the
    /// state outlives a transport destroyed on one of its own threads.
    void startWorkers() {
        for (std::size_t i = 0; i < options.threads; ++i) {
            threads.emplace_back([self = shared_from_this()] { self->ioc.run(); });
        }
    }

    void submit(Pending pending) {
        bool rejected = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                rejected = true;
            } else if (active >= options.maxConnections) {
                queue.push_back(std::move(pending));
                return;
            } else {
                ++active;
            }
        }
        if (rejected) {
            pending.onComplete(TransportOutcome::failed("Transport is shutting down"));
            return;
        }
        start(std::move(pending));
    }

    /// A slot is free: start the next queued request, if any.
    void release() {
        std::optional<Pending> next;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!queue.empty() && !stopping) {
                next = std::move(queue.front());
                queue.pop_front();
            } else {
                --active;
            }
        }
        if (next) {
            start(std::move(*next));
        }
    }

    /// Report @p message from the io_context, never inline from send().
    void failLater(CompletionHandler onComplete, std::string message) {
        net::post(ioc, [self = shared_from_this(), onComplete = std::move(onComplete),
                        message = std::move(message)]() {
            self->release();
            onComplete(TransportOutcome::failed(message));
        });
    }

    void start(Pending pending) {
        UrlParts origin;
        try {
            origin = parseUrl(pending.request.url);
        } catch (const std::invalid_argument& e) {
            return failLater(std::move(pending.onComplete), e.what());
        }

        const bool defaultPort = (origin.scheme == "https" && origin.port == "443") ||
                                 (origin.scheme == "http" && origin.port == "80");

        Job job;
        job.host        = origin.host;
        job.hostHeader  = defaultPort ? origin.host : origin.host + ":" + origin.port;
        job.connectHost = origin.host;
        job.connectPort = origin.port;
        job.target      = origin.target;
        job.verbose     = options.verbose;
        job.maxResponseBytes = options.maxResponseBytes;

        if (proxy) {
            if (origin.scheme == "https") {
                return failLater(std::move(pending.onComplete),
                                 "HTTPS through an HTTP proxy is not supported");
            }
            job.connectHost = proxy->host;
            job.connectPort = proxy->port;
            job.target      = "http://" + job.hostHeader + origin.target;
        }

        if (options.verbose) {
            std::cerr << "[BeastTransport] " << pending.request.method << " "
                      << redactUrl(pending.request.url) << "\n";
        }

        job.request    = std::move(pending.request);
        job.onComplete = std::move(pending.onComplete);
        job.onRelease  = [self = shared_from_this()] { self->release(); };

        if (origin.scheme == "https") {
#ifdef GRAPH_HTTP_HAS_SSL
            std::make_shared<Session<beast::ssl_stream<beast::tcp_stream>>>(
                std::move(job), net::make_strand(ioc), sslContext)->run();
#else
            failLater(std::move(job.onComplete),
                      "HTTPS not supported: built without OpenSSL");
#endif
            return;
        }
        std::make_shared<Session<beast::tcp_stream>>(std::move(job), net::make_strand(ioc))->run();
    }

    void shutdown() {
        std::deque<Pending> abandoned;
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
            abandoned.swap(queue);
        }
        for (auto& pending : abandoned) {
            pending.onComplete(TransportOutcome::failed("Transport destroyed before request started"));
        }

        // Let in-flight sessions complete, then the workers return.
        work.reset();

        // Inside a completion handler no worker can be joined: each one may be
        // waiting for the handler that is running this shutdown.
        const auto current = std::this_thread::get_id();
        const bool onWorker = std::any_of(threads.begin(), threads.end(),
                                          [current](const std::thread& thread) {
                                              return thread.get_id() == current;
                                          });
        for (auto& thread : threads) {
            if (!thread.joinable()) {
                continue;
            }
            if (onWorker) {
                thread.detach();
            } else {
                thread.join();
            }
        }
    }
};

// ---------------------------------------------------------------------------
// BeastTransport
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport() : BeastTransport(Options{}) {}

BeastTransport::BeastTransport(Options options) {
    if (options.maxConnections == 0 || options.threads == 0 || options.maxResponseBytes == 0) {
        throw std::invalid_argument("Transport limits must be positive");
    }
    mImpl = std::make_shared<Impl>(std::move(options));
    mImpl->startWorkers();
}

BeastTransport::~BeastTransport() {
    mImpl->shutdown();
}

void BeastTransport::send(HttpRequest request, CompletionHandler onComplete) {
    mImpl->submit(Impl::Pending{std::move(request), std::move(onComplete)});
}

} // namespace graph_http
