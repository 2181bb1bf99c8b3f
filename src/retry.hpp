#pragma once

#include "errors.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace crawl_sync {

/// Blocks the calling thread.  Injected so tests never wait for real.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for.
Sleeper realSleeper();

/// Thrown when every attempt failed; what() names the attempt count and
/// the last underlying error.
class RetryExhausted : public std::runtime_error {
public:
    RetryExhausted(int attempts, const std::string& lastError);

    int attempts() const { return mAttempts; }
    const std::string& lastError() const { return mLastError; }

private:
    int         mAttempts;
    std::string mLastError;
};

/// Fixed-attempt, fixed-delay retry (no exponential backoff, no jitter).
/// TransferError passes straight through: it is a decision, not a failure.
class RetryPolicy {
public:
    /// Called after every failed attempt with its 1-based number.
    using FailureHook = std::function<void(int attempt, const std::exception& error)>;

    RetryPolicy(int maxAttempts,
                std::chrono::milliseconds delay,
                Sleeper sleeper = realSleeper());

    /// Invoke @p op until it returns, sleeping between attempts.
    /// @throws RetryExhausted once maxAttempts attempts have failed.
    template <typename Fn>
    auto run(Fn&& op, const FailureHook& onFailure = {}) const -> decltype(op());

    int maxAttempts() const { return mMaxAttempts; }
    std::chrono::milliseconds delay() const { return mDelay; }

    void setVerbose(bool v) { mVerbose = v; }

private:
    int                       mMaxAttempts;
    std::chrono::milliseconds mDelay;
    Sleeper                   mSleeper;
    bool                      mVerbose = false;

    void logFailure(int attempt, const std::exception& e) const;
};

template <typename Fn>
auto RetryPolicy::run(Fn&& op, const FailureHook& onFailure) const -> decltype(op()) {
    std::string lastError;

    for (int attempt = 1; attempt <= mMaxAttempts; ++attempt) {
        try {
            return op();
        } catch (const TransferError&) {
            throw;
        } catch (const std::exception& e) {
            lastError = e.what();
            logFailure(attempt, e);
            if (onFailure) {
                onFailure(attempt, e);
            }
            if (attempt < mMaxAttempts) {
                mSleeper(mDelay);
            }
        }
    }

    throw RetryExhausted(mMaxAttempts, lastError);
}

} // namespace crawl_sync
