#include "http_transport.hpp"
#include "compression.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef CRAWL_SYNC_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace crawl_sync {

namespace {

http::request<http::empty_body>
makeRequest(const std::string& host, const std::string& target,
            const std::string& authorization) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::authorization, authorization);
    req.set(http::field::accept_encoding, "gzip, deflate");
    req.set(http::field::user_agent, "crawl_sync/1.0");
    return req;
}

// Run the queued operation to completion.  Synchronous Beast calls ignore
// tcp_stream deadlines; the async ones are cancelled when they expire.
void runQueued(net::io_context& ioc, const beast::error_code& ec) {
    ioc.run();
    ioc.restart();
    if (ec) {
        throw beast::system_error(ec);
    }
}

template <typename Stream>
void exchange(net::io_context& ioc,
              Stream& stream,
              beast::tcp_stream& lowest,
              const http::request<http::empty_body>& req,
              http::response<http::string_body>& res,
              std::chrono::milliseconds timeout) {
    beast::error_code ec;

    lowest.expires_after(timeout);
    http::async_write(stream, req,
        [&ec](beast::error_code e, std::size_t) { ec = e; });
    runQueued(ioc, ec);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Deep TSV chunks routinely exceed Beast's 8 MB default.
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    lowest.expires_after(timeout);
    http::async_read(stream, buffer, parser,
        [&ec](beast::error_code e, std::size_t) { ec = e; });
    runQueued(ioc, ec);

    res = parser.release();
}

Transport::Response
toResponse(const http::response<http::string_body>& res) {
    Transport::Response response;
    response.httpStatus = res.result_int();

    auto encoding = res.find(http::field::content_encoding);
    if (encoding == res.end()) {
        response.body = res.body();
    } else {
        response.body = decodeContent(res.body(), std::string(encoding->value()));
    }
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpTransport::HttpTransport(const std::string& baseUrl,
                             const std::string& username,
                             const std::string& password,
                             int timeoutMs)
    : mAuthorization(basicAuthHeader(username, password))
    , mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target == "/" ? "" : parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef CRAWL_SYNC_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Transport::Response HttpTransport::get(const std::string& target)
{
    const std::string fullTarget = mBasePath + target;

    if (mVerbose) {
        std::cerr << "[HttpTransport] GET " << mHost << ":" << mPort
                  << fullTarget << "\n";
    }

    try {
        return mUseSsl ? doHttpsRequest(fullTarget) : doHttpRequest(fullTarget);
    } catch (const TransportError&) {
        throw;
    } catch (const beast::system_error& e) {
        throw TransportError(std::string("Failed to get ") + mHost + fullTarget +
                             ": " + e.what());
    } catch (const std::runtime_error& e) {
        // Body decoding failures surface here.
        throw TransportError(std::string("Failed to get ") + mHost + fullTarget +
                             ": " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

Transport::Response HttpTransport::doHttpRequest(const std::string& target)
{
    const std::chrono::milliseconds timeout(mTimeoutMs);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve(mHost, mPort);

    beast::error_code ec;
    stream.expires_after(timeout);
    stream.async_connect(results,
        [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runQueued(ioc, ec);

    auto req = makeRequest(mHost, target, mAuthorization);
    http::response<http::string_body> res;
    exchange(ioc, stream, stream, req, res, timeout);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpTransport] HTTP " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

Transport::Response HttpTransport::doHttpsRequest(const std::string& target)
{
#ifdef CRAWL_SYNC_HAS_SSL
    namespace ssl = net::ssl;
    const std::chrono::milliseconds timeout(mTimeoutMs);

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    beast::tcp_stream& lowest = beast::get_lowest_layer(stream);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw TransportError("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(mHost, mPort);

    beast::error_code ec;
    lowest.expires_after(timeout);
    lowest.async_connect(results,
        [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runQueued(ioc, ec);

    lowest.expires_after(timeout);
    stream.async_handshake(ssl::stream_base::client,
        [&ec](beast::error_code e) { ec = e; });
    runQueued(ioc, ec);

    auto req = makeRequest(mHost, target, mAuthorization);
    http::response<http::string_body> res;
    exchange(ioc, stream, lowest, req, res, timeout);

    Response response = toResponse(res);

    if (mVerbose) {
        std::cerr << "[HttpTransport] HTTPS " << response.httpStatus
                  << " (" << response.body.size() << " bytes)\n";
    }

    // Peers often drop the connection instead of answering close_notify.
    lowest.expires_after(timeout);
    stream.async_shutdown([](beast::error_code) {});
    ioc.run();

    return response;
#else
    (void)target;
    throw TransportError("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace crawl_sync
