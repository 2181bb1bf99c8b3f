#include "progress.hpp"
#include "util.hpp"

namespace crawl_sync {

ProgressReporter::ProgressReporter(const TransferStatus& status,
                                   std::ostream& out,
                                   std::chrono::milliseconds interval)
    : mStatus(status)
    , mOut(out)
    , mInterval(interval) {}

ProgressReporter::~ProgressReporter() {
    stop();
}

void ProgressReporter::start() {
    if (mThread.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mStopping = false;
    }
    mThread = std::thread(&ProgressReporter::loop, this);
}

void ProgressReporter::stop() {
    if (!mThread.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mStopping = true;
    }
    mCv.notify_all();
    mThread.join();

    draw(kSpinnerWidth);
    mOut << "\n";
    mOut.flush();
}

std::string ProgressReporter::renderLine(const ProgressSnapshot& snapshot, int frame) {
    const int dots = ((frame % kSpinnerWidth) + kSpinnerWidth) % kSpinnerWidth;

    std::string line = snapshot.statusText;
    line.append(static_cast<std::size_t>(dots), '.');
    line.append(static_cast<std::size_t>(kSpinnerWidth - dots), '*');
    line += " | ETA " + formatDuration(snapshot.eta) + " |";
    line += " Chunk size " + std::to_string(snapshot.chunkSize) + " |";
    line += " " + std::to_string(snapshot.timeoutCount) + " timeouts |";
    line += " " + std::to_string(snapshot.errorCount) + " errors |";
    return line;
}

void ProgressReporter::loop() {
    int frame = 0;
    std::unique_lock<std::mutex> lock(mMutex);
    while (!mStopping) {
        lock.unlock();
        draw(frame);
        frame = (frame + 1) % kSpinnerWidth;
        lock.lock();
        mCv.wait_for(lock, mInterval, [this] { return mStopping; });
    }
}

void ProgressReporter::draw(int frame) {
    const std::string line = renderLine(mStatus.snapshot(), frame);

    mOut << "\r" << line;
    if (line.size() < mLastWidth) {
        mOut << std::string(mLastWidth - line.size(), ' ');
    }
    mOut.flush();
    mLastWidth = line.size();
}

} // namespace crawl_sync
