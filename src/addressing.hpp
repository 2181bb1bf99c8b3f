#pragma once

#include <chrono>
#include <cstdint>

namespace crawl_sync {

/// Where the next unread row lives: request chunk @c index at the current
/// chunk size and drop the first @c skipRows rows of the response.
struct ChunkAddress {
    std::int64_t index    = 0;
    std::int64_t skipRows = 0;
};

/// Every chunk starts with a header row.  Nothing has been written yet at
/// doneElements == 0, so the header is kept; afterwards it is skipped along
/// with the rows of the window that are already on disk.
/// Throws std::invalid_argument if chunkSize <= 0 or doneElements < 0.
ChunkAddress computeChunkAddress(std::int64_t doneElements,
                                 std::int64_t chunkSize);

/// Percentage done, rounded half-up to one decimal as printf("%.1f") shows
/// it.  0 when total is 0.
double progressPercent(std::int64_t doneElements, std::int64_t totalElements);

/// Exponential smoothing of the seconds-per-1000-rows rate.
/// Returns @p previous unchanged when no rows were written.
double smoothRate(double previous,
                  double elapsedSeconds,
                  std::int64_t rows,
                  double alpha);

/// Remaining time at @p secondsPer1000, rounded up to a whole second.
std::chrono::seconds estimateEta(std::int64_t remainingRows,
                                 double secondsPer1000);

} // namespace crawl_sync
