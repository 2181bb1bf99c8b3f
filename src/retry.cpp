#include "retry.hpp"

#include <iostream>
#include <thread>

namespace crawl_sync {

Sleeper realSleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

RetryExhausted::RetryExhausted(int attempts, const std::string& lastError)
    : std::runtime_error("Abandoned after " + std::to_string(attempts) +
                         " attempts, last error: " + lastError)
    , mAttempts(attempts)
    , mLastError(lastError) {}

RetryPolicy::RetryPolicy(int maxAttempts,
                         std::chrono::milliseconds delay,
                         Sleeper sleeper)
    : mMaxAttempts(maxAttempts)
    , mDelay(delay)
    , mSleeper(std::move(sleeper))
{
    if (mMaxAttempts < 1) {
        throw std::invalid_argument("RetryPolicy: maxAttempts must be >= 1");
    }
    if (!mSleeper) {
        throw std::invalid_argument("RetryPolicy: sleeper must be callable");
    }
}

void RetryPolicy::logFailure(int attempt, const std::exception& e) const {
    if (!mVerbose) return;

    std::cerr << "[Retry] " << e.what() << " (attempt " << attempt << "/"
              << mMaxAttempts << ")";
    if (attempt < mMaxAttempts) {
        std::cerr << ", retrying in " << mDelay.count() << " ms";
    }
    std::cerr << "\n";
}

} // namespace crawl_sync
