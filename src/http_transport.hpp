#pragma once

#include <stdexcept>
#include <string>

namespace crawl_sync {

/// Raised for connection-level failures (DNS, connect, TLS, read, body
/// decoding).  HTTP status codes are never reported through this type.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// One parameterized GET against the remote API.
class Transport {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;            // already decompressed
    };

    virtual ~Transport() = default;

    /// @param target  Path plus query string, e.g. "/2.0/crawls/7/pages?chunk=0"
    /// @throws TransportError on network / decode failures.
    virtual Response get(const std::string& target) = 0;
};

/// Transport built on Boost.Beast.  Opens a fresh connection per request,
/// sends Basic credentials and Accept-Encoding, and decodes gzip/deflate
/// bodies transparently.
class HttpTransport : public Transport {
public:
    /// @param baseUrl    Scheme and authority, e.g. "https://api.audisto.com"
    /// @param username   API username (Basic auth)
    /// @param password   API password (Basic auth)
    /// @param timeoutMs  Per-operation socket timeout in milliseconds
    HttpTransport(const std::string& baseUrl,
                  const std::string& username,
                  const std::string& password,
                  int timeoutMs = 120000);

    Response get(const std::string& target) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    std::string mAuthorization;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target);
    Response doHttpsRequest(const std::string& target);
};

} // namespace crawl_sync
