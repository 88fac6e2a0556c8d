#include "classifier.hpp"
#include "util.hpp"

namespace graph_http {

namespace {

struct DatabaseError {
    std::string code;
    std::string message;
};

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string stringField(const nlohmann::json& object, const char* field) {
    if (object.contains(field) && object[field].is_string()) {
        return object[field].get<std::string>();
    }
    return {};
}

/// First error the database reported in @p body.
/// Transaction endpoint: {"errors": [{"code": ..., "message": ...}]}.
/// Legacy endpoints (non-2xx only): {"message": ..., "exception": ..., "fullname": ...}.
std::optional<DatabaseError> firstDatabaseError(const nlohmann::json& body,
                                                bool allowLegacy) {
    if (!body.is_object()) {
        return std::nullopt;
    }
    if (body.contains("errors") && body["errors"].is_array()) {
        const auto& errors = body["errors"];
        if (!errors.empty() && errors[0].is_object()) {
            return DatabaseError{stringField(errors[0], "code"),
                                 stringField(errors[0], "message")};
        }
        if (!errors.empty()) {
            return DatabaseError{"", errors[0].dump()};
        }
        return std::nullopt;
    }
    if (allowLegacy && (body.contains("exception") || body.contains("message"))) {
        std::string code = stringField(body, "fullname");
        if (code.empty()) {
            code = stringField(body, "exception");
        }
        return DatabaseError{code, stringField(body, "message")};
    }
    return std::nullopt;
}

/// Result sets returned before the first failing statement.
std::optional<std::size_t> failingStatementIndex(const nlohmann::json& body,
                                                 const ClassifierContext& context) {
    if (context.statementCount == 1) {
        return 0;
    }
    if (context.statementCount == 0 || !body.is_object() ||
        !body.contains("results") || !body["results"].is_array()) {
        return std::nullopt;
    }
    auto completed = body["results"].size();
    if (completed < context.statementCount) {
        return completed;
    }
    return std::nullopt;
}

ErrorRecord baseRecord(ErrorKind kind,
                       std::string message,
                       const TransportOutcome& outcome,
                       const ClassifierContext& context) {
    auto record = ErrorRecord::make(kind, std::move(message));
    record.detail = context.method + " " + redactUrl(context.url);
    if (outcome.status == TransportOutcome::Status::Completed) {
        record.httpStatus      = outcome.httpStatus;
        record.responseExcerpt = truncate(outcome.body, kResponseExcerptBytes);
    }
    return record;
}

ErrorRecord databaseRecord(ErrorKind kind,
                           const std::optional<DatabaseError>& dbError,
                           const TransportOutcome& outcome,
                           const ClassifierContext& context) {
    std::string message;
    if (dbError && !dbError->message.empty()) {
        message = dbError->message;
    } else {
        message = "HTTP " + std::to_string(outcome.httpStatus);
    }
    auto record = baseRecord(kind, std::move(message), outcome, context);
    if (dbError && !dbError->code.empty()) {
        record.code = dbError->code;
    }
    return record;
}

} // namespace

ErrorKind kindForDatabaseCode(const std::string& code) {
    if (startsWith(code, "Neo.ClientError.Security.")) {
        return ErrorKind::Authentication;
    }
    if (startsWith(code, "Neo.DatabaseError.") || startsWith(code, "Neo.TransientError.")) {
        return ErrorKind::ServerInternal;
    }
    return ErrorKind::ClientRequest;
}

Result<ClassifiedResponse> classify(const TransportOutcome& outcome,
                                    const ClassifierContext& context) {
    // 1. no response at all
    if (outcome.status == TransportOutcome::Status::Failed) {
        return baseRecord(ErrorKind::Transport,
                          outcome.errorMessage.empty() ? "Transport failure"
                                                       : outcome.errorMessage,
                          outcome, context);
    }

    // 2. no response in time
    if (outcome.status == TransportOutcome::Status::TimedOut) {
        return baseRecord(ErrorKind::Timeout,
                          outcome.errorMessage.empty() ? "Request timed out"
                                                       : outcome.errorMessage,
                          outcome, context);
    }

    const auto status   = outcome.httpStatus;
    const bool is2xx    = status >= 200 && status < 300;
    const bool is4xx    = status >= 400 && status < 500;
    const bool is5xx    = status >= 500 && status < 600;
    const bool isDenied = status == 401 || status == 403;

    auto parsed = nlohmann::json::parse(outcome.body, nullptr, /*allow_exceptions=*/false);
    const bool parsedOk = !outcome.bodyTruncated && !parsed.is_discarded() &&
                          !outcome.body.empty();

    std::optional<DatabaseError> dbError;
    if (parsedOk) {
        dbError = firstDatabaseError(parsed, /*allowLegacy=*/!is2xx);
    }
    const auto dbKind = dbError ? kindForDatabaseCode(dbError->code)
                                : ErrorKind::ClientRequest;

    // 3. the database rejected the request
    const bool rejected =
        (is4xx && !isDenied && !(dbError && dbKind == ErrorKind::Authentication)) ||
        (is2xx && dbError && dbKind == ErrorKind::ClientRequest);
    if (rejected) {
        auto record = databaseRecord(ErrorKind::ClientRequest, dbError, outcome, context);
        record.statementIndex = failingStatementIndex(parsedOk ? parsed : nlohmann::json(),
                                                      context);
        return record;
    }

    // 4. authentication / authorization
    if (isDenied || ((is2xx || is4xx) && dbError && dbKind == ErrorKind::Authentication)) {
        return databaseRecord(ErrorKind::Authentication, dbError, outcome, context);
    }

    // 5. server fault
    if (is5xx || (is2xx && dbError && dbKind == ErrorKind::ServerInternal)) {
        auto record = databaseRecord(ErrorKind::ServerInternal, dbError, outcome, context);
        if (is2xx) {
            record.statementIndex = failingStatementIndex(parsed, context);
        }
        return record;
    }

    // 6. unexpected shape
    if (!is2xx) {
        return baseRecord(ErrorKind::Protocol,
                          "Unexpected HTTP status " + std::to_string(status),
                          outcome, context);
    }
    if (outcome.bodyTruncated) {
        return baseRecord(ErrorKind::Protocol, "Response body exceeds the size limit",
                          outcome, context);
    }
    if (context.expectJson && !parsedOk) {
        return baseRecord(ErrorKind::Protocol, "Failed to parse JSON response",
                          outcome, context);
    }

    // 7. success
    ClassifiedResponse response;
    response.httpStatus = status;
    response.rawBody    = outcome.body;
    response.structured = parsedOk;
    response.body       = parsedOk ? std::move(parsed) : nlohmann::json(outcome.body);
    return response;
}

} // namespace graph_http
