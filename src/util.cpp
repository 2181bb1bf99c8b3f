#include "util.hpp"

#include <boost/beast/core/detail/base64.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace crawl_sync {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
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

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty()) {
        throw std::invalid_argument("Invalid URL (empty port): " + url);
    }
    return parts;
}

std::string urlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string buildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += urlEncode(key);
        query += '=';
        query += urlEncode(value);
    }
    return query;
}

std::string basicAuthHeader(const std::string& username,
                            const std::string& password) {
    namespace base64 = boost::beast::detail::base64;

    const std::string credentials = username + ":" + password;
    std::string encoded(base64::encoded_size(credentials.size()), '\0');
    encoded.resize(base64::encode(encoded.data(), credentials.data(),
                                  credentials.size()));
    return "Basic " + encoded;
}

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end   = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string formatDuration(std::chrono::seconds d) {
    long long total = d.count();
    if (total < 0) total = 0;

    const long long hours   = total / 3600;
    const long long minutes = (total % 3600) / 60;
    const long long seconds = total % 60;

    std::string out;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m";
    }
    out += std::to_string(seconds) + "s";
    return out;
}

} // namespace crawl_sync
