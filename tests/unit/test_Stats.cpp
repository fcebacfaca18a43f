#include <gtest/gtest.h>

#include "concurrency/ThreadPool.hpp"
#include "transfer/Error.hpp"
#include "transfer/Stats.hpp"
#include "util/files.hpp"
#include "util/process.hpp"

#include <atomic>
#include <nlohmann/json.hpp>

using namespace usync::transfer;
using namespace usync::util;
using namespace usync::concurrency;

TEST(CopyStatsTest, MinimalIgnoresRecording) {
    auto stats = CopyStats::newMinimal();
    stats.recordCopy(100);
    stats.recordSkip();

    auto other = CopyStats::start();
    other.recordCopy(5);
    stats.merge(other);

    EXPECT_TRUE(stats.isMinimal());
    EXPECT_EQ(stats.files_copied, 0u);
    EXPECT_EQ(stats.bytes_copied, 0u);
    EXPECT_EQ(stats.files_skipped, 0u);
    EXPECT_EQ(stats.elapsed().count(), 0.0);
}

TEST(CopyStatsTest, MergeSumsCounters) {
    auto total = CopyStats::start();
    auto a = CopyStats::start();
    auto b = CopyStats::start();
    a.recordCopy(10);
    a.recordSkip();
    b.recordCopy(20);
    b.recordCopy(30);

    total.merge(b);
    total.merge(a);

    EXPECT_EQ(total.files_copied, 3u);
    EXPECT_EQ(total.bytes_copied, 60u);
    EXPECT_EQ(total.files_skipped, 1u);
    EXPECT_GE(total.elapsed().count(), 0.0);
}

TEST(CopyStatsTest, SerializesToJson) {
    auto stats = CopyStats::start();
    stats.recordCopy(2048);

    const nlohmann::json j = stats;
    EXPECT_EQ(j["files_copied"], 1);
    EXPECT_EQ(j["bytes_copied"], 2048);
    EXPECT_TRUE(j.contains("elapsed_seconds"));

    const nlohmann::json s = SyncStats{3, 300, 1};
    EXPECT_EQ(s["files_deleted"], 1);
}

TEST(BytesToSizeTest, HumanReadableUnits) {
    EXPECT_EQ(bytesToSize(0), "0B");
    EXPECT_EQ(bytesToSize(1023), "1023B");
    EXPECT_EQ(bytesToSize(1024), "1KB");
    EXPECT_EQ(bytesToSize(1536), "1.5KB");
    EXPECT_EQ(bytesToSize(5ull * 1024 * 1024), "5MB");
    EXPECT_EQ(bytesToSize(3ull * 1024 * 1024 * 1024 * 1024), "3TB");
}

TEST(BackendErrorTest, MessageCarriesKindAndCause) {
    const auto e = BackendError::io("Failed to write", "/tmp/x", "No space left on device");
    EXPECT_EQ(e.kind(), BackendError::Kind::IoError);
    EXPECT_EQ(e.path(), "/tmp/x");
    EXPECT_STREQ(e.what(), "IoError: Failed to write /tmp/x (No space left on device)");

    const auto nf = BackendError::notFound("/missing");
    EXPECT_STREQ(nf.what(), "NotFound: Path not found: /missing");

    const CopyError& alias = nf;
    EXPECT_EQ(alias.kind(), BackendError::Kind::NotFound);
}

TEST(BackendErrorTest, MismatchListsEveryFile) {
    const ChecksumMismatchError err({{"s/a", "d/a", "11", "22"}, {"s/b", "d/b", "33", "44"}});
    EXPECT_EQ(err.mismatches().size(), 2u);
    EXPECT_EQ(err.expected(), "11");
    EXPECT_NE(std::string(err.what()).find("d/b"), std::string::npos);
}

TEST(ThreadPoolTest, RunsEverySubmittedTask) {
    struct Add final : Task {
        std::atomic<int>& counter;
        explicit Add(std::atomic<int>& c) : counter(c) {}
        void operator()() override { ++counter; }
    };

    std::atomic<int> counter{0};
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.workerCount(), 3u);
        for (int i = 0; i < 50; ++i) pool.submit(std::make_shared<Add>(counter));
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, RejectsWorkAfterStop) {
    ThreadPool pool(1);
    pool.stop();

    struct Noop final : Task {
        void operator()() override {}
    };
    EXPECT_THROW(pool.submit(std::make_shared<Noop>()), std::runtime_error);
}

TEST(ProcessTest, CapturesOutputAndExitCode) {
    const auto res = runProcess({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(res.exitCode, 3);
    EXPECT_EQ(res.out, "out\n");
    EXPECT_EQ(res.err, "err\n");
    EXPECT_FALSE(res.ok());

    EXPECT_EQ(runProcess({"/nonexistent/binary"}).exitCode, EXEC_FAILED);
}

TEST(ProcessTest, QuotesForRemoteShell) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(joinArgs({"scp", "-r", "a", "b"}), "scp -r a b");
}
