#pragma once

#include <string>

namespace crawl_sync {

/// Decode an HTTP body according to its Content-Encoding header value.
/// Supports "gzip", "x-gzip" and "deflate"; empty or "identity" returns
/// the body unchanged.
/// @throws std::runtime_error on corrupt data or an unsupported encoding.
std::string decodeContent(const std::string& body,
                          const std::string& contentEncoding);

/// Gzip-compress @p data.  Used to build fixtures and by the local test server.
std::string gzipCompress(const std::string& data);

} // namespace crawl_sync
