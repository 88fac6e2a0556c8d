#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace graph_http {

/// Orders header names case-insensitively ("content-type" == "Content-Type").
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;    // "http" or "https"
    std::string userInfo;  // "user:pass" when present, never logged
    std::string host;
    std::string port;      // "80", "443", "7474", etc.
    std::string target;    // path component (e.g. "/db/data/cypher")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Append @p path to @p baseUrl with exactly one '/' between them.
/// An absolute @p path ("http://...") is returned unchanged.
std::string joinUrl(const std::string& baseUrl, const std::string& path);

/// Strip user-info from a URL so it can be logged or stored in errors.
std::string redactUrl(const std::string& url);

/// Cut @p text to at most @p maxBytes, marking the cut.
std::string truncate(const std::string& text, std::size_t maxBytes);

/// True when @p text is empty or only whitespace.
bool isBlank(const std::string& text);

} // namespace graph_http
