#include "addressing.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace crawl_sync {

ChunkAddress computeChunkAddress(std::int64_t doneElements,
                                 std::int64_t chunkSize) {
    if (chunkSize <= 0) {
        throw std::invalid_argument("chunk size must be positive, got " +
                                    std::to_string(chunkSize));
    }
    if (doneElements < 0) {
        throw std::invalid_argument("done elements must not be negative, got " +
                                    std::to_string(doneElements));
    }

    ChunkAddress address;
    if (doneElements == 0) {
        return address;
    }

    address.index    = doneElements / chunkSize;
    address.skipRows = doneElements % chunkSize + 1;
    return address;
}

double progressPercent(std::int64_t doneElements, std::int64_t totalElements) {
    if (totalElements <= 0 || doneElements <= 0) {
        return 0.0;
    }
    if (doneElements >= totalElements) {
        return 100.0;
    }

    // Permille rounded half-up, in integers so large counts stay exact.
    const std::int64_t permille =
        (doneElements * 2000 + totalElements) / (2 * totalElements);
    return static_cast<double>(permille) / 10.0;
}

double smoothRate(double previous,
                  double elapsedSeconds,
                  std::int64_t rows,
                  double alpha) {
    if (rows <= 0) {
        return previous;
    }
    const double instant = elapsedSeconds / (static_cast<double>(rows) / 1000.0);
    return alpha * instant + (1.0 - alpha) * previous;
}

std::chrono::seconds estimateEta(std::int64_t remainingRows,
                                 double secondsPer1000) {
    if (remainingRows <= 0 || secondsPer1000 <= 0.0) {
        return std::chrono::seconds(0);
    }
    const double seconds =
        static_cast<double>(remainingRows) / 1000.0 * secondsPer1000;
    return std::chrono::seconds(static_cast<long long>(std::ceil(seconds)));
}

} // namespace crawl_sync
