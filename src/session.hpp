#pragma once

#include "checkpoint.hpp"
#include "chunk_fetcher.hpp"
#include "output_sink.hpp"
#include "retry.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace crawl_sync {

struct SessionOptions {
    std::string  outputPath;        // empty: rows go to the console stream
    bool         details          = true;
    bool         resume           = true;
    std::int64_t initialChunkSize = kDefaultChunkSize;
};

/// Everything the transfer loop needs, ready to run.
struct Session {
    Checkpoint                       checkpoint;
    std::unique_ptr<OutputSink>      sink;
    std::unique_ptr<CheckpointStore> store;    // nullptr for console output
    bool                             resumed = false;
};

/// Ask the API for the number of rows of the crawl.
/// Non-200 statuses are retried unless they classify as fatal.
/// @throws TransferError (ClientFatal, TransportFatal or MalformedChunk).
std::int64_t probeTotalElements(ChunkFetcher& fetcher,
                                const RetryPolicy& retry,
                                bool verbose = false);

/// Decide between a new and a resumed download and open sink + sidecar.
/// Resume checks run before any request is sent.
///
/// @param console   Where rows go when options.outputPath is empty
/// @param messages  Where informational notices are printed
/// @throws TransferError (Setup for file-state problems, or the probe's kinds).
Session openSession(const SessionOptions& options,
                    ChunkFetcher& fetcher,
                    const RetryPolicy& probeRetry,
                    std::ostream& console,
                    std::ostream& messages,
                    bool verbose = false);

} // namespace crawl_sync
