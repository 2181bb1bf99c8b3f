#include "chunk_fetcher.hpp"
#include "util.hpp"

#include <iostream>

namespace crawl_sync {

ChunkFetcher::ChunkFetcher(Transport& transport,
                           std::uint64_t crawlId,
                           bool details,
                           bool verbose)
    : mTransport(transport)
    , mCrawlId(crawlId)
    , mDetails(details)
    , mVerbose(verbose) {}

std::string ChunkFetcher::path() const {
    return "/2.0/crawls/" + std::to_string(mCrawlId) + "/pages";
}

std::string ChunkFetcher::chunkTarget(std::int64_t chunkIndex,
                                      std::int64_t chunkSize) const {
    return path() + "?" + buildQueryString({
        {"deep",       mDetails ? "1" : "0"},
        {"chunk",      std::to_string(chunkIndex)},
        {"chunk_size", std::to_string(chunkSize)},
        {"output",     "tsv"},
    });
}

std::string ChunkFetcher::countProbeTarget() const {
    return path() + "?" + buildQueryString({
        {"deep",       "0"},
        {"chunk",      "0"},
        {"chunk_size", "1"},
        {"output",     "json"},
    });
}

Transport::Response ChunkFetcher::fetchChunk(std::int64_t chunkIndex,
                                             std::int64_t chunkSize) {
    if (mVerbose) {
        std::cerr << "[ChunkFetcher] chunk=" << chunkIndex
                  << " chunk_size=" << chunkSize << "\n";
    }
    return mTransport.get(chunkTarget(chunkIndex, chunkSize));
}

Transport::Response ChunkFetcher::fetchCountProbe() {
    if (mVerbose) {
        std::cerr << "[ChunkFetcher] probing total row count\n";
    }
    return mTransport.get(countProbeTarget());
}

} // namespace crawl_sync
