#include "result.hpp"

#include <sstream>

namespace graph_http {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport:      return "Transport";
        case ErrorKind::Timeout:        return "Timeout";
        case ErrorKind::Authentication: return "Authentication";
        case ErrorKind::ClientRequest:  return "ClientRequest";
        case ErrorKind::ServerInternal: return "ServerInternal";
        case ErrorKind::Protocol:       return "Protocol";
    }
    return "Unknown";
}

ErrorRecord ErrorRecord::make(ErrorKind kind, std::string message) {
    ErrorRecord record;
    record.kind    = kind;
    record.message = std::move(message);
    return record;
}

bool ErrorRecord::isRetryable() const {
    return kind == ErrorKind::Transport || kind == ErrorKind::Timeout;
}

ErrorRecord ErrorRecord::withContext(const std::string& context) const {
    ErrorRecord wrapped = *this;
    wrapped.message = context + ": " + message;
    wrapped.cause   = std::make_shared<const ErrorRecord>(*this);
    return wrapped;
}

std::string ErrorRecord::toString() const {
    std::ostringstream out;
    out << graph_http::toString(kind) << ": " << message;
    if (code) {
        out << " [" << *code << "]";
    }
    if (statementIndex) {
        out << " (statement " << *statementIndex << ")";
    }
    if (httpStatus) {
        out << " HTTP " << *httpStatus;
    }
    if (detail) {
        out << " <" << *detail << ">";
    }
    return out.str();
}

} // namespace graph_http
