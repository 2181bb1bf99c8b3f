#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace crawl_sync {

/// Point-in-time copy of TransferStatus for display.
struct ProgressSnapshot {
    std::int64_t         doneElements    = 0;
    std::int64_t         totalElements   = 0;
    std::int64_t         chunkSize       = 0;
    int                  timeoutCount    = 0;
    int                  errorCount      = 0;
    double               secondsPer1000  = 0.0;
    double               percentComplete = 0.0;
    std::chrono::seconds eta{0};
    std::string          statusText;
    bool                 finished        = false;
};

/// Counters written by the transfer loop and polled by the progress
/// reporter.  Only the transfer loop writes.
class TransferStatus {
public:
    void setProgress(std::int64_t done, std::int64_t total);
    void setChunkSize(std::int64_t chunkSize);
    void setTimeoutCount(int count);
    void incrementErrors();
    void setSecondsPer1000(double rate);
    void setStatusText(const std::string& text);
    void markFinished();

    int errorCount() const { return mErrorCount.load(std::memory_order_relaxed); }

    ProgressSnapshot snapshot() const;

private:
    std::atomic<std::int64_t> mDone{0};
    std::atomic<std::int64_t> mTotal{0};
    std::atomic<std::int64_t> mChunkSize{0};
    std::atomic<int>          mTimeoutCount{0};
    std::atomic<int>          mErrorCount{0};
    std::atomic<double>       mSecondsPer1000{0.0};
    std::atomic<bool>         mFinished{false};

    mutable std::mutex mTextMutex;
    std::string        mStatusText;
};

} // namespace crawl_sync
