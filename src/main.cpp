#include "chunk_fetcher.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "progress.hpp"
#include "retry.hpp"
#include "session.hpp"
#include "transfer_engine.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printSummary(const crawl_sync::TransferEngine& engine) {
    const auto stats    = engine.getStats();
    const auto snapshot = engine.status().snapshot();

    std::cerr
        << "\n=== Summary Report ===\n"
        << "Rows written:        " << stats.rowsWritten         << "\n"
        << "Chunks written:      " << stats.chunksWritten       << "\n"
        << "Total requests:      " << stats.totalRequests       << "\n"
        << "Failed requests:     " << stats.totalRetries        << "\n"
        << "Errors:              " << snapshot.errorCount       << "\n"
        << "Final chunk size:    " << snapshot.chunkSize        << "\n"
        << "Total pause (s):     " << std::fixed << std::setprecision(2)
                                   << stats.totalPauseSeconds   << "\n"
        << "======================\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace crawl_sync;

    Config cfg;
    try {
        cfg = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usageText();
        return 1;
    }

    if (cfg.showHelp || !hasRequiredFields(cfg)) {
        std::cerr << usageText();
        return 0;
    }

    try {
        if (cfg.verbose) {
            std::cerr
                << "=== crawl_sync ===\n"
                << "Endpoint:   " << cfg.endpoint  << "\n"
                << "Crawl:      " << cfg.crawlId   << "\n"
                << "Output:     " << (cfg.output.empty() ? "<stdout>" : cfg.output) << "\n"
                << "Details:    " << (cfg.details ? "yes" : "no") << "\n"
                << "Resume:     " << (cfg.resume ? "yes" : "no") << "\n"
                << "Chunk size: " << cfg.chunkSize << "\n"
                << "Timeout:    " << cfg.timeoutMs << " ms\n"
                << "==================\n\n";
        }

        HttpTransport transport(cfg.endpoint, cfg.username, cfg.password,
                                cfg.timeoutMs);
        transport.setVerbose(cfg.verbose);
        ChunkFetcher fetcher(transport, cfg.crawlId, cfg.details, cfg.verbose);

        RetryPolicy probeRetry(5, std::chrono::seconds(1));
        probeRetry.setVerbose(cfg.verbose);

        SessionOptions options;
        options.outputPath       = cfg.output;
        options.details          = cfg.details;
        options.resume           = cfg.resume;
        options.initialChunkSize = cfg.chunkSize;

        Session session = openSession(options, fetcher, probeRetry,
                                      std::cout, std::cout, cfg.verbose);

        TransferEngine engine(fetcher, *session.sink, session.checkpoint,
                              session.store.get(), EngineOptions{},
                              realSleeper(), cfg.verbose);

        // Rows own stdout when there is no output file.
        std::unique_ptr<ProgressReporter> reporter;
        if (session.store) {
            reporter = std::make_unique<ProgressReporter>(engine.status(), std::cout);
            reporter->start();
        }

        try {
            engine.run();
        } catch (const TransferError&) {
            if (reporter) reporter->stop();
            if (cfg.verbose) printSummary(engine);
            throw;
        }

        if (reporter) reporter->stop();
        if (cfg.verbose) printSummary(engine);
        return 0;

    } catch (const TransferError& e) {
        std::cout << e.what() << "\n";
        if (cfg.verbose) {
            std::cerr << "[main] aborted (" << toString(e.kind()) << ")\n";
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
