#pragma once

#include "transfer_status.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace crawl_sync {

/// Background thread that redraws a one-line progress display from a
/// TransferStatus.  Reads only; never touches the transfer loop.
class ProgressReporter {
public:
    static constexpr int kSpinnerWidth = 10;

    ProgressReporter(const TransferStatus& status,
                     std::ostream& out,
                     std::chrono::milliseconds interval = std::chrono::milliseconds(500));
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void start();

    /// Join the thread and print the final state followed by a newline.
    void stop();

    /// "<status><spinner> | ETA <d> | Chunk size <n> | <t> timeouts | <e> errors |"
    static std::string renderLine(const ProgressSnapshot& snapshot, int frame);

private:
    const TransferStatus&     mStatus;
    std::ostream&             mOut;
    std::chrono::milliseconds mInterval;

    std::thread             mThread;
    std::mutex              mMutex;
    std::condition_variable mCv;
    bool                    mStopping = false;
    std::size_t             mLastWidth = 0;

    void loop();
    void draw(int frame);
};

} // namespace crawl_sync
