#include "transfer_status.hpp"
#include "addressing.hpp"

namespace crawl_sync {

namespace {
constexpr auto kRelaxed = std::memory_order_relaxed;
}

void TransferStatus::setProgress(std::int64_t done, std::int64_t total) {
    mDone.store(done, kRelaxed);
    mTotal.store(total, kRelaxed);
}

void TransferStatus::setChunkSize(std::int64_t chunkSize) {
    mChunkSize.store(chunkSize, kRelaxed);
}

void TransferStatus::setTimeoutCount(int count) {
    mTimeoutCount.store(count, kRelaxed);
}

void TransferStatus::incrementErrors() {
    mErrorCount.fetch_add(1, kRelaxed);
}

void TransferStatus::setSecondsPer1000(double rate) {
    mSecondsPer1000.store(rate, kRelaxed);
}

void TransferStatus::setStatusText(const std::string& text) {
    std::lock_guard<std::mutex> lock(mTextMutex);
    mStatusText = text;
}

void TransferStatus::markFinished() {
    mFinished.store(true, std::memory_order_release);
}

ProgressSnapshot TransferStatus::snapshot() const {
    ProgressSnapshot s;
    s.doneElements    = mDone.load(kRelaxed);
    s.totalElements   = mTotal.load(kRelaxed);
    s.chunkSize       = mChunkSize.load(kRelaxed);
    s.timeoutCount    = mTimeoutCount.load(kRelaxed);
    s.errorCount      = mErrorCount.load(kRelaxed);
    s.secondsPer1000  = mSecondsPer1000.load(kRelaxed);
    s.finished        = mFinished.load(std::memory_order_acquire);
    s.percentComplete = progressPercent(s.doneElements, s.totalElements);
    s.eta             = estimateEta(s.totalElements - s.doneElements,
                                    s.secondsPer1000);
    {
        std::lock_guard<std::mutex> lock(mTextMutex);
        s.statusText = mStatusText;
    }
    return s;
}

} // namespace crawl_sync
