#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace graph_http {

/// Closed set of failure categories. Values never change meaning.
enum class ErrorKind {
    Transport,       // no response: connection refused, DNS failure, reset
    Timeout,         // no response within the configured timeout
    Authentication,  // 401/403 or a security error reported by the database
    ClientRequest,   // the database rejected the statement or request
    ServerInternal,  // 5xx or a database-side fault
    Protocol         // request or response did not have the expected shape
};

const char* toString(ErrorKind kind);

/// One failed call. Carries enough of the response to debug the failure,
/// never the request headers.
struct ErrorRecord {
    ErrorKind                           kind = ErrorKind::Protocol;
    std::string                         message;
    std::shared_ptr<const ErrorRecord>  cause;
    std::optional<std::string>          code;            // e.g. "Neo.ClientError.Statement.SyntaxError"
    std::optional<std::string>          detail;          // "POST http://host/db/data/cypher"
    std::optional<std::size_t>          statementIndex;
    std::optional<unsigned int>         httpStatus;
    std::string                         responseExcerpt;

    static ErrorRecord make(ErrorKind kind, std::string message);

    /// Transport and Timeout failures may succeed when re-sent.
    bool isRetryable() const;

    /// Copy of this record with @p context prepended to the message and
    /// the original kept as the cause.
    ErrorRecord withContext(const std::string& context) const;

    std::string toString() const;
};

/// Exactly one of a value or an ErrorRecord.
template <typename T>
class Result {
public:
    Result(T value) : mState(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorRecord error) : mState(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return mState.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().message);
        }
        return std::get<0>(mState);
    }

    T& value() & {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().message);
        }
        return std::get<0>(mState);
    }

    T&& value() && {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " + error().message);
        }
        return std::get<0>(std::move(mState));
    }

    const ErrorRecord& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on success");
        }
        return std::get<1>(mState);
    }

private:
    std::variant<T, ErrorRecord> mState;
};

} // namespace graph_http
