#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace crawl_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/2.0")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode a query component (RFC 3986 unreserved characters pass through).
std::string urlEncode(const std::string& value);

/// Build "k1=v1&k2=v2" from ordered pairs, encoding keys and values.
std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params);

/// Value for an HTTP "Authorization" header using the Basic scheme.
std::string basicAuthHeader(const std::string& username,
                            const std::string& password);

/// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

/// Compact duration like "1h2m3s", "4m0s", "12s".
std::string formatDuration(std::chrono::seconds d);

} // namespace crawl_sync
