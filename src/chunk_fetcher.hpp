#pragma once

#include "http_transport.hpp"

#include <cstdint>
#include <string>

namespace crawl_sync {

/// Builds the two request shapes of the crawl pages endpoint
/// (GET /2.0/crawls/{crawl}/pages) and sends them through a Transport.
class ChunkFetcher {
public:
    /// @param details  false requests deep=0 (the --no-details schema)
    ChunkFetcher(Transport& transport,
                 std::uint64_t crawlId,
                 bool details,
                 bool verbose = false);

    /// One TSV data chunk.
    Transport::Response fetchChunk(std::int64_t chunkIndex,
                                   std::int64_t chunkSize);

    /// JSON probe (chunk=0, chunk_size=1) whose envelope carries the total
    /// number of rows of the crawl.
    Transport::Response fetchCountProbe();

    /// Request target for a data chunk, exposed for logging and tests.
    std::string chunkTarget(std::int64_t chunkIndex,
                            std::int64_t chunkSize) const;
    std::string countProbeTarget() const;

    bool details() const { return mDetails; }

private:
    Transport&    mTransport;
    std::uint64_t mCrawlId;
    bool          mDetails;
    bool          mVerbose;

    std::string path() const;
};

} // namespace crawl_sync
