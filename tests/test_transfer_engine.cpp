/// @file test_transfer_engine.cpp
/// Tests for transfer_engine.hpp — the chunk loop end to end against an
/// in-memory crawl API, with a recording sleeper instead of real pauses.

#include "transfer_engine.hpp"
#include "mapping.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <sstream>

using namespace crawl_sync;
using test_support::FakeCrawlApi;
using test_support::SleepLog;
using test_support::TempDir;
using test_support::readFile;
using test_support::writeFile;

namespace {

/// One output file with its sidecar, driven by a fresh engine per run().
struct Download {
    Download(FakeCrawlApi& api, const std::string& output, bool details = true)
        : fetcher(api, 77, details), store(output), path(output) {}

    Checkpoint fresh(std::int64_t total, std::int64_t chunkSize = kDefaultChunkSize) {
        Checkpoint cp;
        cp.outputFilename = path;
        cp.chunkSize      = chunkSize;
        cp.totalElements  = total;
        cp.noDetails      = !fetcher.details();
        store.save(cp);
        return cp;
    }

    std::unique_ptr<TransferEngine> engine(const Checkpoint& cp, FileSink::Mode mode,
                                           SleepLog& log) {
        sink = std::make_unique<FileSink>(path, mode);
        return std::make_unique<TransferEngine>(fetcher, *sink, cp, &store,
                                                EngineOptions{}, log.sleeper());
    }

    ChunkFetcher               fetcher;
    CheckpointStore            store;
    std::string                path;
    std::unique_ptr<FileSink>  sink;
};

ErrorKind runExpectingError(TransferEngine& engine) {
    try {
        engine.run();
    } catch (const TransferError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected TransferError";
    return ErrorKind::Setup;
}

} // namespace

// ============================================================================
// Happy path
// ============================================================================

TEST(TransferEngine, DownloadsAllRowsWithFinalChunkClamp) {
    TempDir dir;
    FakeCrawlApi api(25000);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    auto engine = dl.engine(dl.fresh(25000), FileSink::Mode::Create, log);
    engine->run();

    const auto reqs = api.chunkRequests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].chunk, 0);
    EXPECT_EQ(reqs[0].chunkSize, 10000);
    EXPECT_EQ(reqs[1].chunk, 1);
    EXPECT_EQ(reqs[1].chunkSize, 10000);
    // 5000 remaining: the size itself drops, so 20000 / 5000 addresses chunk 4.
    EXPECT_EQ(reqs[2].chunk, 4);
    EXPECT_EQ(reqs[2].chunkSize, 5000);
    for (const auto& r : reqs) EXPECT_EQ(r.deep, "1");

    EXPECT_EQ(engine->checkpoint().doneElements, 25000);
    EXPECT_EQ(engine->checkpoint().chunkSize, 5000);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
    EXPECT_FALSE(dl.store.exists());
    EXPECT_TRUE(log.sleeps.empty());

    auto snap = engine->status().snapshot();
    EXPECT_TRUE(snap.finished);
    EXPECT_EQ(snap.statusText, "@@@ COMPLETED 100% @@@");
    EXPECT_DOUBLE_EQ(snap.percentComplete, 100.0);
    EXPECT_EQ(snap.errorCount, 0);

    auto stats = engine->getStats();
    EXPECT_EQ(stats.totalRequests, 3);
    EXPECT_EQ(stats.chunksWritten, 3);
    EXPECT_EQ(stats.rowsWritten, 25000);
}

TEST(TransferEngine, NoDetailsRequestsShallowRows) {
    TempDir dir;
    FakeCrawlApi api(5);
    Download dl(api, dir.file("pages.tsv"), false);
    SleepLog log;

    auto engine = dl.engine(dl.fresh(5), FileSink::Mode::Create, log);
    engine->run();

    ASSERT_EQ(api.chunkRequests().size(), 1u);
    EXPECT_EQ(api.chunkRequests()[0].deep, "0");
    EXPECT_EQ(api.chunkRequests()[0].chunkSize, 5);
}

TEST(TransferEngine, AlreadyCompleteMakesNoRequests) {
    TempDir dir;
    FakeCrawlApi api(100);
    Download dl(api, dir.file("pages.tsv"));
    writeFile(dl.path, api.expectedFile());
    SleepLog log;

    auto cp = dl.fresh(100);
    cp.doneElements = 100;
    dl.store.save(cp);

    auto engine = dl.engine(cp, FileSink::Mode::Append, log);
    engine->run();

    EXPECT_TRUE(api.requests().empty());
    EXPECT_FALSE(dl.store.exists());
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
    EXPECT_TRUE(engine->status().snapshot().finished);
}

TEST(TransferEngine, EmptyCrawlCompletesImmediately) {
    TempDir dir;
    FakeCrawlApi api(0);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    auto engine = dl.engine(dl.fresh(0), FileSink::Mode::Create, log);
    engine->run();

    EXPECT_TRUE(api.requests().empty());
    EXPECT_FALSE(dl.store.exists());
}

TEST(TransferEngine, ConsoleSinkWithoutCheckpoint) {
    FakeCrawlApi api(30);
    ChunkFetcher fetcher(api, 77, true);
    std::ostringstream out;
    StreamSink sink(out);
    SleepLog log;

    Checkpoint cp;
    cp.chunkSize     = 7;
    cp.totalElements = 30;

    TransferEngine engine(fetcher, sink, cp, nullptr, EngineOptions{}, log.sleeper());
    engine.run();
    EXPECT_EQ(out.str(), api.expectedFile());
}

TEST(TransferEngine, RejectsCheckpointPairedWithConsoleSink) {
    TempDir dir;
    FakeCrawlApi api(1);
    ChunkFetcher fetcher(api, 77, true);
    std::ostringstream out;
    StreamSink sink(out);
    CheckpointStore store(dir.file("pages.tsv"));

    Checkpoint cp;
    cp.totalElements = 1;
    EXPECT_THROW(TransferEngine(fetcher, sink, cp, &store), std::invalid_argument);
}

// ============================================================================
// Resume
// ============================================================================

TEST(TransferEngine, ResumeAfterAbortIsByteIdentical) {
    TempDir dir;
    FakeCrawlApi api(25000);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    // First run: two chunks land, then the server refuses the third.
    api.queueBody(api.chunkBody(0, 10000));
    api.queueBody(api.chunkBody(1, 10000));
    api.queueStatus(403);
    {
        auto engine = dl.engine(dl.fresh(25000), FileSink::Mode::Create, log);
        EXPECT_EQ(runExpectingError(*engine), ErrorKind::ClientFatal);
    }

    auto saved = dl.store.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->doneElements, 20000);

    // Second run continues from the sidecar.
    auto engine = dl.engine(*saved, FileSink::Mode::Append, log);
    engine->run();

    EXPECT_EQ(readFile(dl.path), api.expectedFile());
    EXPECT_FALSE(dl.store.exists());
}

TEST(TransferEngine, ResumeAtUnalignedOffsetSkipsStoredRows) {
    TempDir dir;
    FakeCrawlApi api(50);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    // 13 rows already on disk with a chunk size of 10.
    std::string partial = "url\tstatus\tsize\n";
    for (int i = 0; i < 13; ++i) partial += FakeCrawlApi::rowAt(i) + "\n";
    writeFile(dl.path, partial);

    auto cp = dl.fresh(50, 10);
    cp.doneElements = 13;
    dl.store.save(cp);

    auto engine = dl.engine(cp, FileSink::Mode::Append, log);
    engine->run();

    const auto reqs = api.chunkRequests();
    ASSERT_FALSE(reqs.empty());
    EXPECT_EQ(reqs[0].chunk, 1);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

// ============================================================================
// Status handling
// ============================================================================

TEST(TransferEngine, TooManyRequestsPausesAndRepeatsTheSameRequest) {
    TempDir dir;
    FakeCrawlApi api(20);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueStatus(429);
    auto engine = dl.engine(dl.fresh(20, 10), FileSink::Mode::Create, log);
    engine->run();

    const auto reqs = api.chunkRequests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].target, reqs[1].target);

    ASSERT_EQ(log.sleeps.size(), 1u);
    EXPECT_EQ(log.sleeps[0], std::chrono::seconds(30));
    EXPECT_EQ(engine->status().errorCount(), 0);
    EXPECT_EQ(engine->checkpoint().chunkSize, 10);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, ServerErrorPausesAndCountsAnError) {
    TempDir dir;
    FakeCrawlApi api(10);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueStatus(503);
    auto engine = dl.engine(dl.fresh(10), FileSink::Mode::Create, log);
    engine->run();

    ASSERT_EQ(log.sleeps.size(), 1u);
    EXPECT_EQ(log.sleeps[0], std::chrono::seconds(30));
    EXPECT_EQ(engine->status().errorCount(), 1);
    EXPECT_EQ(engine->timeoutCount(), 0);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, ThreeTimeoutsShrinkTheChunkAndResetTheCounter) {
    TempDir dir;
    FakeCrawlApi api(25000);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueStatus(504);
    api.queueStatus(504);
    api.queueStatus(504);
    api.queueStatus(504);
    auto engine = dl.engine(dl.fresh(25000), FileSink::Mode::Create, log);
    engine->run();

    const auto reqs = api.chunkRequests();
    // Three at 10000, the fourth 504 at 9000 does not shrink again.
    ASSERT_GE(reqs.size(), 5u);
    EXPECT_EQ(reqs[0].chunkSize, 10000);
    EXPECT_EQ(reqs[2].chunkSize, 10000);
    EXPECT_EQ(reqs[3].chunkSize, 9000);
    EXPECT_EQ(reqs[4].chunkSize, 9000);

    EXPECT_EQ(log.sleeps.size(), 4u);
    EXPECT_EQ(engine->timeoutCount(), 1);
    EXPECT_EQ(engine->status().errorCount(), 4);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, ShrinkPersistsInTheCheckpoint) {
    TempDir dir;
    FakeCrawlApi api(30000);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    // Chunk 0 lands, then three timeouts, then the server refuses.
    api.queueBody(api.chunkBody(0, 10000));
    api.queueStatus(504);
    api.queueStatus(504);
    api.queueStatus(504);
    api.queueStatus(404);

    auto engine = dl.engine(dl.fresh(30000), FileSink::Mode::Create, log);
    EXPECT_EQ(runExpectingError(*engine), ErrorKind::ClientFatal);

    // Only committed chunks reach the sidecar; the shrink shows up after the
    // next successful chunk.
    auto saved = dl.store.load();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->doneElements, 10000);
    EXPECT_EQ(engine->checkpoint().chunkSize, 9000);

    auto resumed = *saved;
    resumed.chunkSize = engine->checkpoint().chunkSize;
    auto second = dl.engine(resumed, FileSink::Mode::Append, log);
    second->run();

    // done=10000 at size 9000: chunk 1, skip header + 1000 rows.
    const auto reqs = api.chunkRequests();
    EXPECT_EQ(reqs[5].chunk, 1);
    EXPECT_EQ(reqs[5].chunkSize, 9000);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, ShrinkNeverGoesBelowOne) {
    TempDir dir;
    FakeCrawlApi api(5);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueStatus(504);
    api.queueStatus(504);
    api.queueStatus(504);
    auto engine = dl.engine(dl.fresh(5, 500), FileSink::Mode::Create, log);
    engine->run();

    const auto reqs = api.chunkRequests();
    ASSERT_EQ(reqs.size(), 8u);
    EXPECT_EQ(reqs[3].chunkSize, 1);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, ForbiddenAbortsLeavingStateUntouched) {
    TempDir dir;
    FakeCrawlApi api(20);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueBody(api.chunkBody(0, 10));
    api.queueStatus(403);
    auto engine = dl.engine(dl.fresh(20, 10), FileSink::Mode::Create, log);

    try {
        engine->run();
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClientFatal);
        EXPECT_STREQ(e.what(), "Access denied. Wrong credentials?");
    }

    EXPECT_EQ(dl.store.load()->doneElements, 10);
    EXPECT_EQ(readFile(dl.path), api.chunkBody(0, 10));
    EXPECT_TRUE(log.sleeps.empty());
}

TEST(TransferEngine, NotFoundAndUnexpectedStatusesAreFatal) {
    for (unsigned int status : {404u, 400u, 302u}) {
        TempDir dir;
        FakeCrawlApi api(20);
        Download dl(api, dir.file("pages.tsv"));
        SleepLog log;

        api.queueStatus(status);
        auto engine = dl.engine(dl.fresh(20), FileSink::Mode::Create, log);
        EXPECT_EQ(runExpectingError(*engine), ErrorKind::ClientFatal) << status;
        EXPECT_EQ(dl.store.load()->doneElements, 0) << status;
        EXPECT_EQ(readFile(dl.path), "") << status;
        EXPECT_EQ(engine->status().errorCount(), 1) << status;
    }
}

// ============================================================================
// Transport failures
// ============================================================================

TEST(TransferEngine, TransientFailuresAreRetriedWithTenSecondDelay) {
    TempDir dir;
    FakeCrawlApi api(10);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueFailure();
    api.queueFailure();
    auto engine = dl.engine(dl.fresh(10), FileSink::Mode::Create, log);
    engine->run();

    ASSERT_EQ(log.sleeps.size(), 2u);
    EXPECT_EQ(log.sleeps[0], std::chrono::seconds(10));
    EXPECT_EQ(engine->status().errorCount(), 2);
    EXPECT_EQ(engine->getStats().totalRetries, 2);
    EXPECT_EQ(engine->getStats().totalRequests, 3);
    EXPECT_EQ(readFile(dl.path), api.expectedFile());
}

TEST(TransferEngine, FiveFailuresAbortWithNetworkError) {
    TempDir dir;
    FakeCrawlApi api(10);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    for (int i = 0; i < 5; ++i) api.queueFailure();
    auto engine = dl.engine(dl.fresh(10), FileSink::Mode::Create, log);

    try {
        engine->run();
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportFatal);
        EXPECT_STREQ(e.what(), "Network error; please check your connection to the "
                               "internet and resume download.");
    }

    EXPECT_EQ(api.chunkRequests().size(), 5u);
    EXPECT_EQ(log.sleeps.size(), 4u);
    EXPECT_EQ(engine->status().errorCount(), 5);
    EXPECT_TRUE(dl.store.exists());
    EXPECT_EQ(dl.store.load()->doneElements, 0);
}

// ============================================================================
// Malformed chunks
// ============================================================================

TEST(TransferEngine, OversizedRowWritesNothing) {
    TempDir dir;
    FakeCrawlApi api(3);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueBody("url\tstatus\tsize\nrow0\n" + std::string(kMaxRowBytes + 1, 'x') + "\n");
    auto engine = dl.engine(dl.fresh(3), FileSink::Mode::Create, log);

    EXPECT_EQ(runExpectingError(*engine), ErrorKind::MalformedChunk);
    EXPECT_EQ(readFile(dl.path), "");
    EXPECT_EQ(dl.store.load()->doneElements, 0);
}

TEST(TransferEngine, EmptyFirstChunkIsMalformed) {
    TempDir dir;
    FakeCrawlApi api(3);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueBody("");
    auto engine = dl.engine(dl.fresh(3), FileSink::Mode::Create, log);
    EXPECT_EQ(runExpectingError(*engine), ErrorKind::MalformedChunk);
}

TEST(TransferEngine, HeaderOnlyChunkIsMalformed) {
    TempDir dir;
    FakeCrawlApi api(3);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueBody("url\tstatus\tsize\n");
    auto engine = dl.engine(dl.fresh(3), FileSink::Mode::Create, log);
    EXPECT_EQ(runExpectingError(*engine), ErrorKind::MalformedChunk);
    EXPECT_EQ(readFile(dl.path), "");
}

TEST(TransferEngine, MoreRowsThanRemainingIsMalformed) {
    TempDir dir;
    FakeCrawlApi api(3);
    Download dl(api, dir.file("pages.tsv"));
    SleepLog log;

    api.queueBody("h\nr0\nr1\nr2\nr3\n");
    auto engine = dl.engine(dl.fresh(3), FileSink::Mode::Create, log);
    EXPECT_EQ(runExpectingError(*engine), ErrorKind::MalformedChunk);
    EXPECT_EQ(readFile(dl.path), "");
    EXPECT_EQ(dl.store.load()->doneElements, 0);
}
