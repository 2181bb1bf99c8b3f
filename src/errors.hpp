#pragma once

#include <stdexcept>
#include <string>

namespace crawl_sync {

/// Why a session stopped before completion.
enum class ErrorKind {
    Setup,            // bad input or inconsistent files on disk
    ClientFatal,      // 403 / 404 / other 4xx / unexpected status
    TransportFatal,   // retry budget exhausted on connection failures
    MalformedChunk,   // body could not be scanned as the expected rows
    Io                // output or checkpoint could not be written
};

const char* toString(ErrorKind kind);

/// Aborts a session.  what() is the user-facing message.  Never retried.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), mKind(kind) {}

    ErrorKind kind() const { return mKind; }

private:
    ErrorKind mKind;
};

} // namespace crawl_sync
