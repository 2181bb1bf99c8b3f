#include "errors.hpp"

namespace crawl_sync {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Setup:          return "setup";
        case ErrorKind::ClientFatal:    return "client error";
        case ErrorKind::TransportFatal: return "network error";
        case ErrorKind::MalformedChunk: return "malformed chunk";
        case ErrorKind::Io:             return "i/o error";
    }
    return "unknown";
}

} // namespace crawl_sync
