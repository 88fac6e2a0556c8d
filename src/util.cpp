#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace graph_http {

bool CaseInsensitiveLess::operator()(const std::string& a,
                                     const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + redactUrl(url));
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + parts.scheme);
    }

    // --- authority ([userinfo@]host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        parts.userInfo = authority.substr(0, at);
        authority      = authority.substr(at + 1);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid URL (bad port): " + redactUrl(url));
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + redactUrl(url));
    }
    return parts;
}

std::string joinUrl(const std::string& baseUrl, const std::string& path) {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        return path;
    }
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base + "/";
    }
    return path.front() == '/' ? base + path : base + "/" + path;
}

std::string redactUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return url;
    }
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);
    auto authorityEnd = (pathStart == std::string::npos) ? url.size() : pathStart;

    auto at = url.rfind('@', authorityEnd);
    if (at == std::string::npos || at < hostStart) {
        return url;
    }
    return url.substr(0, hostStart) + "***@" + url.substr(at + 1);
}

std::string truncate(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    return text.substr(0, maxBytes) + " ...(truncated)";
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

} // namespace graph_http
