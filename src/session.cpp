#include "session.hpp"
#include "mapping.hpp"
#include "status_table.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace crawl_sync {

namespace {

bool pathExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string boolText(bool b) { return b ? "true" : "false"; }

} // namespace

std::int64_t probeTotalElements(ChunkFetcher& fetcher,
                                const RetryPolicy& retry,
                                bool verbose)
{
    std::string body;
    try {
        body = retry.run([&] {
            auto response = fetcher.fetchCountProbe();

            const StatusClass cls = classifyStatus(response.httpStatus);
            if (cls.action == StatusAction::Fatal) {
                throw TransferError(ErrorKind::ClientFatal, cls.message);
            }
            if (cls.action != StatusAction::Proceed) {
                throw std::runtime_error(
                    "error while trying to get total number of elements; statusCode " +
                    std::to_string(response.httpStatus));
            }
            return std::move(response.body);
        });
    } catch (const RetryExhausted& e) {
        throw TransferError(ErrorKind::TransportFatal, e.what());
    }

    ChunkEnvelope envelope;
    try {
        envelope = parseChunkEnvelope(body);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::MalformedChunk,
                            std::string("Cannot read total row count: ") + e.what());
    }

    if (verbose) {
        std::cerr << "[Session] crawl has " << envelope.total << " rows\n";
    }
    return envelope.total;
}

Session openSession(const SessionOptions& options,
                    ChunkFetcher& fetcher,
                    const RetryPolicy& probeRetry,
                    std::ostream& console,
                    std::ostream& messages,
                    bool verbose)
{
    if (options.initialChunkSize <= 0) {
        throw TransferError(ErrorKind::Setup, "Chunk size must be positive.");
    }

    Session session;
    session.checkpoint.outputFilename = options.outputPath;
    session.checkpoint.chunkSize      = options.initialChunkSize;
    session.checkpoint.noDetails      = !options.details;

    // --- console: nothing to resume ---
    if (options.outputPath.empty()) {
        session.checkpoint.totalElements =
            probeTotalElements(fetcher, probeRetry, verbose);
        session.sink = std::make_unique<StreamSink>(console);
        return session;
    }

    auto store = std::make_unique<CheckpointStore>(options.outputPath);
    const bool outputExists  = pathExists(options.outputPath);
    const bool sidecarExists = store->exists();
    const bool startAnew     = !outputExists && !sidecarExists;

    // --- new download ---
    if (!options.resume || startAnew) {
        if (startAnew && options.resume) {
            messages << "No download to resume; starting new.\n";
        }
        if (outputExists) {
            throw TransferError(ErrorKind::Setup,
                "File already exists; please resume removing --no-resume, "
                "delete or specify another output filename.");
        }

        session.checkpoint.totalElements =
            probeTotalElements(fetcher, probeRetry, verbose);

        try {
            store->save(session.checkpoint);
            session.sink = std::make_unique<FileSink>(options.outputPath,
                                                      FileSink::Mode::Create);
        } catch (const std::runtime_error& e) {
            throw TransferError(ErrorKind::Io, e.what());
        }
        session.store = std::move(store);
        return session;
    }

    // --- resume ---
    if (!outputExists) {
        throw TransferError(ErrorKind::Setup,
            "Cannot resume; \"" + options.outputPath +
            "\" file does not exist: use --no-resume to create new.");
    }
    if (!sidecarExists) {
        throw TransferError(ErrorKind::Setup,
            "Cannot resume; resumer file " + store->path() + " does not exist");
    }

    std::optional<Checkpoint> loaded;
    try {
        loaded = store->load();
    } catch (const CheckpointError& e) {
        throw TransferError(ErrorKind::Setup, e.what());
    }
    if (!loaded) {
        throw TransferError(ErrorKind::Setup,
            "Cannot resume; resumer file " + store->path() + " does not exist");
    }

    if (loaded->noDetails != !options.details) {
        throw TransferError(ErrorKind::Setup,
            "Warning! This file was begun with --no-details=" +
            boolText(loaded->noDetails) + "; continuing with --no-details=" +
            boolText(!options.details) + " will break the file.");
    }

    if (verbose) {
        std::cerr << "[Session] resuming " << options.outputPath << " at "
                  << loaded->doneElements << "/" << loaded->totalElements
                  << " (chunk size " << loaded->chunkSize << ")\n";
    }

    try {
        session.sink = std::make_unique<FileSink>(options.outputPath,
                                                  FileSink::Mode::Append);
    } catch (const SinkError& e) {
        throw TransferError(ErrorKind::Io, e.what());
    }
    session.checkpoint = *loaded;
    session.store      = std::move(store);
    session.resumed    = true;
    return session;
}

} // namespace crawl_sync
