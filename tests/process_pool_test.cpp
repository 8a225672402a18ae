#include "gtest/gtest.h"

#include "test_support.hpp"

#include "justdl/errors.hpp"
#include "justdl/process_pool.hpp"

#include <chrono>
#include <thread>

using namespace justdl;
using namespace justdl::test;

namespace {

TaskDescriptor makeTask(TaskId id, const std::string& behavior, const std::string& name,
                        const std::filesystem::path& destination) {
    TaskDescriptor task;
    task.id = id;
    task.url = scriptedUrl(behavior, name);
    task.kind = TaskKind::DirectFile;
    task.destination = destination.string();
    return task;
}

} // namespace

TEST(ProcessPoolTest, CompletedWorkerYieldsSuccess) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(2), scriptedFactory(dir.path()));

    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "ok", "a.bin", dir.path())));
    const auto results = pollResults(pool, 1);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].task.id, 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Success);
    EXPECT_EQ(results[0].file_path, (dir.path() / "a.bin").string());
    EXPECT_EQ(results[0].bytes, std::string("payload:a.bin").size());
    EXPECT_EQ(readFile(dir.path() / "a.bin"), "payload:a.bin");
    EXPECT_EQ(pool.activeCount(), 0u);
}

TEST(ProcessPoolTest, RefusesWorkBeyondCapacity) {
    TempDir dir;
    TempDir gates;
    ProcessPool pool(fastPoolOptions(2), scriptedFactory(gates.path()));

    EXPECT_TRUE(pool.startIfCapacity(makeTask(1, "gate", "a", dir.path())));
    EXPECT_TRUE(pool.startIfCapacity(makeTask(2, "gate", "b", dir.path())));
    EXPECT_FALSE(pool.startIfCapacity(makeTask(3, "gate", "c", dir.path())));
    EXPECT_EQ(pool.activeCount(), 2u);
    EXPECT_FALSE(pool.isActive(3));

    writeFile(gates.path() / "a", "");
    const auto first = pollResults(pool, 1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].task.id, 1u);

    EXPECT_TRUE(pool.startIfCapacity(makeTask(3, "gate", "c", dir.path())));
    EXPECT_EQ(pool.activeCount(), 2u);

    writeFile(gates.path() / "b", "");
    writeFile(gates.path() / "c", "");
    const auto rest = pollResults(pool, 2);
    ASSERT_EQ(rest.size(), 2u);
    for (const auto& result : rest) {
        EXPECT_EQ(result.outcome, Outcome::Success);
    }
}

TEST(ProcessPoolTest, ReportedFailureKeepsItsKind) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(1), scriptedFactory(dir.path()));

    ASSERT_TRUE(pool.startIfCapacity(makeTask(7, "fail", "x", dir.path())));
    const auto results = pollResults(pool, 1);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Failure);
    ASSERT_TRUE(results[0].error.has_value());
    EXPECT_EQ(*results[0].error, ErrorKind::Network);
    EXPECT_EQ(results[0].error_message, "connection reset by peer");
}

TEST(ProcessPoolTest, SilentExitIsWorkerCrash) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(1), scriptedFactory(dir.path()));

    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "crash", "x", dir.path())));
    const auto results = pollResults(pool, 1);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Failure);
    EXPECT_EQ(results[0].error, ErrorKind::WorkerCrash);
    EXPECT_NE(results[0].error_message.find("exit code 3"), std::string::npos);
}

TEST(ProcessPoolTest, FrozenWorkerIsKilledAfterGrace) {
    TempDir dir;
    auto options = fastPoolOptions(1);
    options.liveness_grace = std::chrono::milliseconds(300);
    ProcessPool pool(options, scriptedFactory(dir.path()));

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "hang", "x", dir.path())));
    const auto results = pollResults(pool, 1);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Failure);
    EXPECT_EQ(results[0].error, ErrorKind::WorkerCrash);
    EXPECT_NE(results[0].error_message.find("unresponsive"), std::string::npos);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(300));
}

TEST(ProcessPoolTest, StuckToolFreesTheSlot) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(1), scriptedFactory(dir.path()));

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "stuck-tool", "x.mp4", dir.path())));
    const auto results = pollResults(pool, 1, std::chrono::seconds(10));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Failure);
    EXPECT_EQ(results[0].error, ErrorKind::MediaProcessing);
    EXPECT_NE(results[0].error_message.find("did not finish within 300 ms"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(pool.activeCount(), 0u);
}

TEST(ProcessPoolTest, TerminateCancelsRunningWorker) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(1), scriptedFactory(dir.path()));
    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "slow", "x", dir.path())));

    // wait until the worker is demonstrably running
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        EXPECT_TRUE(pool.pollCompleted().empty());
        const auto progress = pool.activeProgress();
        if (!progress.empty() && progress[0].downloaded_bytes > 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    const auto progress = pool.activeProgress();
    ASSERT_EQ(progress.size(), 1u);
    EXPECT_EQ(progress[0].stage, "downloading");
    EXPECT_EQ(progress[0].filename, "x");
    EXPECT_GT(progress[0].downloaded_bytes, 0u);

    pool.terminate(1);
    pool.terminate(1);
    pool.terminate(42);

    const auto results = pollResults(pool, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Cancelled);
    EXPECT_EQ(results[0].error, ErrorKind::Cancelled);
    EXPECT_FALSE(pool.isActive(1));
}

TEST(ProcessPoolTest, WorkerIgnoringTerminateIsKilled) {
    TempDir dir;
    auto options = fastPoolOptions(1);
    options.liveness_grace = std::chrono::milliseconds(300);
    ProcessPool pool(options, scriptedFactory(dir.path()));
    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "stubborn", "x", dir.path())));

    pool.terminate(1);
    const auto results = pollResults(pool, 1);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, Outcome::Cancelled);
}

TEST(ProcessPoolTest, ShutdownStopsEverything) {
    TempDir dir;
    ProcessPool pool(fastPoolOptions(3), scriptedFactory(dir.path()));
    ASSERT_TRUE(pool.startIfCapacity(makeTask(1, "slow", "a", dir.path())));
    ASSERT_TRUE(pool.startIfCapacity(makeTask(2, "stubborn", "b", dir.path())));

    const auto results = pool.shutdown();

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_EQ(result.outcome, Outcome::Cancelled);
    }
    EXPECT_EQ(pool.activeCount(), 0u);
    EXPECT_TRUE(pool.pollCompleted().empty());
}

TEST(ProcessPoolTest, ConcurrencyLimitCanChange) {
    TempDir dir;
    TempDir gates;
    ProcessPool pool(fastPoolOptions(1), scriptedFactory(gates.path()));

    EXPECT_TRUE(pool.startIfCapacity(makeTask(1, "gate", "a", dir.path())));
    EXPECT_FALSE(pool.startIfCapacity(makeTask(2, "gate", "b", dir.path())));
    pool.setMaxConcurrency(2);
    EXPECT_TRUE(pool.startIfCapacity(makeTask(2, "gate", "b", dir.path())));
    pool.setMaxConcurrency(0);
    EXPECT_EQ(pool.maxConcurrency(), 1);

    writeFile(gates.path() / "a", "");
    writeFile(gates.path() / "b", "");
    EXPECT_EQ(pollResults(pool, 2).size(), 2u);
}
