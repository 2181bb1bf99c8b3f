#include "transfer_engine.hpp"
#include "mapping.hpp"
#include "status_table.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace crawl_sync {

namespace {

std::string progressText(double percent, std::int64_t total) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f%% of %lld pages", percent,
                  static_cast<long long>(total));
    return buf;
}

} // namespace

TransferEngine::TransferEngine(ChunkFetcher& fetcher,
                               OutputSink& sink,
                               Checkpoint checkpoint,
                               const CheckpointStore* store,
                               EngineOptions options,
                               Sleeper sleeper,
                               bool verbose)
    : mFetcher(fetcher)
    , mSink(sink)
    , mCheckpoint(std::move(checkpoint))
    , mStore(store)
    , mOptions(options)
    , mSleeper(std::move(sleeper))
    , mRetry(options.retryAttempts, options.retryDelay, mSleeper)
    , mVerbose(verbose)
    , mSecondsPer1000(options.initialSecondsPer1000)
{
    validate(mCheckpoint);
    if (mStore != nullptr && !mSink.durable()) {
        throw std::invalid_argument("a checkpoint needs a durable output sink");
    }
    mRetry.setVerbose(verbose);

    mStatus.setChunkSize(mCheckpoint.chunkSize);
    mStatus.setSecondsPer1000(mSecondsPer1000);
    publishProgress();
}

// ---------------------------------------------------------------------------
// Public: transfer loop
// ---------------------------------------------------------------------------

void TransferEngine::run()
{
    while (true) {
        const auto startTime = std::chrono::steady_clock::now();

        publishProgress();
        if (mCheckpoint.complete()) {
            finish();
            return;
        }

        // The last chunk is requested at exactly the remaining size.
        const std::int64_t remaining =
            mCheckpoint.totalElements - mCheckpoint.doneElements;
        if (remaining < mCheckpoint.chunkSize) {
            mCheckpoint.chunkSize = remaining;
            mStatus.setChunkSize(mCheckpoint.chunkSize);
        }

        const ChunkAddress address =
            computeChunkAddress(mCheckpoint.doneElements, mCheckpoint.chunkSize);

        if (mVerbose) {
            std::cerr << "[TransferEngine] done=" << mCheckpoint.doneElements
                      << "/" << mCheckpoint.totalElements
                      << " chunk=" << address.index
                      << " size=" << mCheckpoint.chunkSize
                      << " skip=" << address.skipRows << "\n";
        }

        const auto response = fetch(address);
        if (!handleStatus(response.httpStatus)) {
            continue;
        }

        const std::int64_t appended = commitChunk(response.body, address);

        const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - startTime;
        mSecondsPer1000 = smoothRate(mSecondsPer1000, elapsed.count(), appended,
                                     mOptions.smoothingFactor);
        mStatus.setSecondsPer1000(mSecondsPer1000);
    }
}

// ---------------------------------------------------------------------------
// Private: loop steps
// ---------------------------------------------------------------------------

void TransferEngine::publishProgress() {
    mStatus.setProgress(mCheckpoint.doneElements, mCheckpoint.totalElements);
    mStatus.setStatusText(progressText(
        progressPercent(mCheckpoint.doneElements, mCheckpoint.totalElements),
        mCheckpoint.totalElements));
}

void TransferEngine::finish() {
    mStatus.setStatusText("@@@ COMPLETED 100% @@@");

    if (mStore != nullptr) {
        if (mVerbose) {
            std::cerr << "[TransferEngine] removing " << mStore->path() << "\n";
        }
        try {
            mStore->remove();
        } catch (const CheckpointError& e) {
            throw TransferError(ErrorKind::Io, e.what());
        }
    }
    mStatus.markFinished();
}

Transport::Response TransferEngine::fetch(const ChunkAddress& address) {
    try {
        return mRetry.run(
            [&] {
                ++mStats.totalRequests;
                return mFetcher.fetchChunk(address.index, mCheckpoint.chunkSize);
            },
            [this](int, const std::exception&) {
                ++mStats.totalRetries;
                mStatus.incrementErrors();
            });
    } catch (const RetryExhausted& e) {
        if (mVerbose) {
            std::cerr << "[TransferEngine] Too many failures while calling next chunk: "
                      << e.what() << "\n";
        }
        throw TransferError(ErrorKind::TransportFatal,
                            "Network error; please check your connection to the "
                            "internet and resume download.");
    }
}

bool TransferEngine::handleStatus(unsigned int httpStatus) {
    const StatusClass cls = classifyStatus(httpStatus);

    if (countsAsError(httpStatus)) {
        mStatus.incrementErrors();
    }
    if (mVerbose && cls.action != StatusAction::Proceed) {
        std::cerr << "[TransferEngine] HTTP " << httpStatus << " -> "
                  << toString(cls.action) << "\n";
    }

    switch (cls.action) {
        case StatusAction::Proceed:
            return true;

        case StatusAction::Throttle:
        case StatusAction::Retry:
            pause();
            return false;

        case StatusAction::Shrink:
            ++mTimeoutCount;
            if (mTimeoutCount >= mOptions.timeoutThreshold) {
                shrinkChunkSize();
                mTimeoutCount = 0;
            }
            mStatus.setTimeoutCount(mTimeoutCount);
            pause();
            return false;

        case StatusAction::Fatal:
            break;
    }
    throw TransferError(ErrorKind::ClientFatal, cls.message);
}

void TransferEngine::pause() {
    mStats.totalPauseSeconds +=
        std::chrono::duration<double>(mOptions.pauseDelay).count();
    mSleeper(mOptions.pauseDelay);
}

void TransferEngine::shrinkChunkSize() {
    const std::int64_t previous = mCheckpoint.chunkSize;
    mCheckpoint.chunkSize = std::max<std::int64_t>(1, previous - mOptions.shrinkStep);
    mStatus.setChunkSize(mCheckpoint.chunkSize);

    if (mVerbose) {
        std::cerr << "[TransferEngine] repeated timeouts: chunk size "
                  << previous << " -> " << mCheckpoint.chunkSize << "\n";
    }
}

std::int64_t TransferEngine::commitChunk(const std::string& body,
                                         const ChunkAddress& address)
{
    std::vector<std::string> rows;
    try {
        rows = splitRows(body);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::MalformedChunk,
                            std::string("Error while scanning chunk: ") + e.what());
    }

    const bool firstChunk = mCheckpoint.doneElements == 0;
    if (firstChunk && rows.empty()) {
        throw TransferError(ErrorKind::MalformedChunk,
                            "Error while scanning chunk: first chunk has no header row");
    }

    // Everything before `first` is the header or already on disk.
    const std::size_t first = static_cast<std::size_t>(
        (firstChunk ? 1 : 0) + address.skipRows);
    const std::int64_t newRows = rows.size() > first
        ? static_cast<std::int64_t>(rows.size() - first) : 0;
    const std::int64_t remaining =
        mCheckpoint.totalElements - mCheckpoint.doneElements;

    if (newRows == 0) {
        throw TransferError(ErrorKind::MalformedChunk,
                            "Error while scanning chunk " + std::to_string(address.index) +
                            ": no rows beyond the " + std::to_string(first) +
                            " already stored");
    }
    if (newRows > remaining) {
        throw TransferError(ErrorKind::MalformedChunk,
                            "Error while scanning chunk " + std::to_string(address.index) +
                            ": " + std::to_string(newRows) + " new rows but only " +
                            std::to_string(remaining) + " remain");
    }

    try {
        if (firstChunk) {
            mSink.writeRow(rows.front());
        }
        for (std::size_t i = first; i < rows.size(); ++i) {
            mSink.writeRow(rows[i]);
        }
        mSink.flush();
    } catch (const SinkError& e) {
        throw TransferError(ErrorKind::Io, e.what());
    }

    mCheckpoint.doneElements += newRows;

    if (mStore != nullptr) {
        try {
            mStore->save(mCheckpoint);
        } catch (const CheckpointError& e) {
            throw TransferError(ErrorKind::Io, e.what());
        }
    }

    ++mStats.chunksWritten;
    mStats.rowsWritten += newRows;

    if (mVerbose) {
        std::cerr << "[TransferEngine] appended " << newRows << " rows (done="
                  << mCheckpoint.doneElements << ")\n";
    }
    return newRows;
}

} // namespace crawl_sync
