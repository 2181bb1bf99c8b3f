#pragma once

#include "addressing.hpp"
#include "checkpoint.hpp"
#include "chunk_fetcher.hpp"
#include "output_sink.hpp"
#include "retry.hpp"
#include "transfer_status.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace crawl_sync {

/// Tunables of the transfer loop.  Defaults match the production service.
struct EngineOptions {
    int                       retryAttempts    = 5;
    std::chrono::milliseconds retryDelay       {10000};
    std::chrono::milliseconds pauseDelay       {30000};  // after 429 / 5xx
    std::int64_t              shrinkStep       = 1000;
    int                       timeoutThreshold = 3;
    double                    smoothingFactor  = 0.005;
    double                    initialSecondsPer1000 = 5.0;
};

/// Sequential chunk-transfer loop: address the next chunk, fetch it with
/// retry, classify the status, append new rows, flush, then checkpoint.
class TransferEngine {
public:
    struct Stats {
        int          totalRequests     = 0;   // fetch attempts, including failed ones
        int          totalRetries      = 0;   // failed fetch attempts
        int          chunksWritten     = 0;
        std::int64_t rowsWritten       = 0;   // data rows, header excluded
        double       totalPauseSeconds = 0.0;
    };

    /// @param store  Sidecar for durable sinks; nullptr for console output.
    TransferEngine(ChunkFetcher& fetcher,
                   OutputSink& sink,
                   Checkpoint checkpoint,
                   const CheckpointStore* store,
                   EngineOptions options = {},
                   Sleeper sleeper = realSleeper(),
                   bool verbose = false);

    /// Run until doneElements == totalElements.
    /// @throws TransferError on any abort; durable state is left as of the
    ///         last committed chunk.
    void run();

    const TransferStatus& status() const { return mStatus; }
    const Checkpoint& checkpoint() const { return mCheckpoint; }
    int timeoutCount() const { return mTimeoutCount; }
    Stats getStats() const { return mStats; }

private:
    ChunkFetcher&          mFetcher;
    OutputSink&            mSink;
    Checkpoint             mCheckpoint;
    const CheckpointStore* mStore;
    EngineOptions          mOptions;
    Sleeper                mSleeper;
    RetryPolicy            mRetry;
    bool                   mVerbose;

    int            mTimeoutCount   = 0;
    double         mSecondsPer1000 = 0.0;
    TransferStatus mStatus;
    Stats          mStats{};

    void publishProgress();
    void finish();

    Transport::Response fetch(const ChunkAddress& address);

    /// @return true when the response carries rows to process.
    bool handleStatus(unsigned int httpStatus);
    void pause();
    void shrinkChunkSize();

    /// Append the new rows of @p body, flush, checkpoint.
    /// @return data rows appended.
    std::int64_t commitChunk(const std::string& body, const ChunkAddress& address);
};

} // namespace crawl_sync
