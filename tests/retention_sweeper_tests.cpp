#include <gtest/gtest.h>
#include "chunkvault/merge_engine.h"
#include "chunkvault/retention_sweeper.h"
#include "test_support.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <shared_mutex>
#include <thread>

using namespace chunkvault;
using chunkvault::testing::FixedLedger;
using chunkvault::testing::ScratchDir;
using chunkvault::testing::readFile;
using chunkvault::testing::digestOf;
using chunkvault::testing::toBytes;

namespace fs = std::filesystem;
using std::chrono::hours;
using std::chrono::seconds;

class RetentionSweeperTest : public ::testing::Test {
protected:
    void createSession(const std::string& sid, Clock::time_point createdAt) {
        ASSERT_TRUE(registry_.ensureSession("alice", sid, sid + ".bin", "docs", 2, createdAt).ok());
    }

    void putChunk(const std::string& sid, std::uint32_t index, const std::string& payload) {
        auto bytes = toBytes(payload);
        ASSERT_TRUE(chunks_.putChunk("alice", sid, index, bytes, digestOf(bytes)).ok());
    }

    ScratchDir dir_;
    FixedLedger ledger_{1000};
    Workspace workspace_{dir_.path()};
    SessionRegistry registry_{workspace_};
    QuotaAccountant quota_{ledger_};
    ChunkStore chunks_{workspace_, registry_, quota_};
    RetentionSweeper sweeper_{workspace_, registry_, chunks_, quota_, hours(24), seconds(1)};
    Clock::time_point now_ = Clock::now();
};

// Sweeps racing merges and chunk writes. Logs go to a scratch file so the
// tests can check that nothing was reported at ERROR.
class SweepRaceTest : public RetentionSweeperTest {
protected:
    void SetUp() override { Logger::init(logFile().string(), LogLevel::DEBUG); }
    void TearDown() override { Logger::init(chunkvault::logsDir() + "/chunkvault_tests.log", LogLevel::DEBUG); }

    fs::path logFile() const { return logDir_.path() / "sweep_race.log"; }
    bool loggedErrors() const { return readFile(logFile()).find("\"level\":\"ERROR\"") != std::string::npos; }

    ScratchDir logDir_;
    ScratchDir artifactDir_;
    ArtifactStore artifacts_{artifactDir_.path()};
    MergeEngine merger_{workspace_, registry_, chunks_, artifacts_, quota_};
};

TEST_F(RetentionSweeperTest, RemovesOnlyStaleSessions) {
    createSession("stale", now_ - hours(25));
    putChunk("stale", 0, std::string(40, 'a'));
    createSession("fresh", now_ - hours(1));
    putChunk("fresh", 1, std::string(10, 'b'));
    EXPECT_EQ(quota_.usage("alice").usedBytes, 50u);

    EXPECT_EQ(sweeper_.sweep(now_, hours(24)), 1u);
    EXPECT_EQ(registry_.describe("alice", "stale").code(), ErrorCode::SessionNotFound);
    EXPECT_FALSE(fs::exists(workspace_.sessionDir("alice", "stale")));
    EXPECT_TRUE(registry_.describe("alice", "fresh").ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 10u);
}

TEST_F(RetentionSweeperTest, SecondSweepCountsNothing) {
    MetricsRegistry::instance().reset();
    createSession("stale", now_ - hours(48));
    putChunk("stale", 0, "abc");
    EXPECT_EQ(sweeper_.sweep(now_, hours(24)), 1u);
    EXPECT_EQ(sweeper_.sweep(now_, hours(24)), 0u);
    EXPECT_EQ(quota_.usage("alice").usedBytes, 0u);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().counterValue("chunkvault_sessions_swept_total"), 1.0);
}

TEST_F(RetentionSweeperTest, IncompleteAndEmptySessionsAreSwept) {
    createSession("empty", now_ - hours(30));
    createSession("half", now_ - hours(30));
    putChunk("half", 1, "zz");
    EXPECT_EQ(sweeper_.sweep(now_, hours(24)), 2u);
    EXPECT_TRUE(registry_.listSessions().empty());
}

TEST_F(RetentionSweeperTest, OrphanedWorkspaceIsRemovedWithoutRelease) {
    quota_.resetUsage("alice", 7);
    const fs::path orphan = workspace_.sessionDir("alice", "lost");
    fs::create_directories(orphan);
    std::ofstream(orphan / Workspace::chunkFileName(0)) << "xyz";
    fs::last_write_time(orphan, fs::file_time_type::clock::now() - hours(48));

    EXPECT_EQ(sweeper_.sweep(Clock::now(), hours(24)), 0u);
    EXPECT_FALSE(fs::exists(orphan));
    EXPECT_EQ(quota_.usage("alice").usedBytes, 7u);
}

TEST_F(RetentionSweeperTest, RecentOrphanIsLeftAlone) {
    const fs::path orphan = workspace_.sessionDir("alice", "creating");
    fs::create_directories(orphan);
    sweeper_.sweep(Clock::now(), hours(24));
    EXPECT_TRUE(fs::exists(orphan));
}

TEST_F(RetentionSweeperTest, BackgroundThreadSweeps) {
    RetentionSweeper eager(workspace_, registry_, chunks_, quota_, seconds(1), seconds(1));
    createSession("old", Clock::now() - hours(2));
    eager.start();
    EXPECT_TRUE(eager.running());
    for (int i = 0; i < 50 && registry_.describe("alice", "old").ok(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    eager.stop();
    EXPECT_FALSE(eager.running());
    EXPECT_EQ(registry_.describe("alice", "old").code(), ErrorCode::SessionNotFound);
}

TEST_F(SweepRaceTest, SessionMergedAfterListingCountsAsNothingToDo) {
    MetricsRegistry::instance().reset();
    createSession("s1", now_ - hours(48));
    putChunk("s1", 0, "aaa");
    putChunk("s1", 1, "bbb");

    // Hold the session while the sweeper lists it and queues for the lock.
    auto lease = workspace_.sessionLock("alice", "s1");
    std::unique_lock<std::shared_mutex> held(lease.mutex());
    auto pass = std::async(std::launch::async, [this] { return sweeper_.sweep(now_, hours(24)); });
    for (int i = 0; i < 1000 && workspace_.sessionLockHolders("alice", "s1") < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_EQ(workspace_.sessionLockHolders("alice", "s1"), 2u);

    // Finish the upload the way a merge does: bytes stay billed, session goes.
    ASSERT_TRUE(registry_.retire("alice", "s1").ok());
    held.unlock();

    EXPECT_EQ(pass.get(), 0u);
    EXPECT_EQ(quota_.usage("alice").usedBytes, 6u);
    EXPECT_DOUBLE_EQ(MetricsRegistry::instance().counterValue("chunkvault_sessions_swept_total"), 0.0);
    EXPECT_FALSE(loggedErrors());
}

TEST_F(SweepRaceTest, SweepAndMergeOnOneStaleSessionAgree) {
    std::uint64_t billed = 0;
    for (int round = 0; round < 20; ++round) {
        const std::string sid = "race-" + std::to_string(round);
        createSession(sid, now_ - hours(48));
        putChunk(sid, 0, "aaa");
        putChunk(sid, 1, "bbb");
        createSession("live", now_);

        auto merged = std::async(std::launch::async, [&] { return merger_.merge("alice", sid); });
        auto swept = std::async(std::launch::async, [&] { return sweeper_.sweep(now_, hours(24)); });
        auto written = std::async(std::launch::async, [&] {
            auto bytes = toBytes("w");
            return chunks_.putChunk("alice", "live", static_cast<std::uint32_t>(round % 2), bytes,
                                    digestOf(bytes));
        });

        auto mergeResult = merged.get();
        const std::size_t removed = swept.get();
        ASSERT_TRUE(written.get().ok());
        ASSERT_LE(removed, 1u);

        const auto artifact = artifacts_.stat("alice", "docs", sid + ".bin");
        if (mergeResult.ok()) {
            EXPECT_EQ(removed, 0u);
            ASSERT_TRUE(artifact.has_value());
            EXPECT_EQ(readFile(artifacts_.artifactPath("alice", "docs", sid + ".bin")), "aaabbb");
            billed += 6;
        } else {
            EXPECT_EQ(mergeResult.code(), ErrorCode::SessionNotFound);
            EXPECT_EQ(removed, 1u);
            EXPECT_FALSE(artifact.has_value());
        }
        EXPECT_EQ(registry_.describe("alice", sid).code(), ErrorCode::SessionNotFound);
        ASSERT_TRUE(registry_.retire("alice", "live").ok());
        quota_.release("alice", 1);
        EXPECT_EQ(quota_.usage("alice").usedBytes, billed) << "round " << round;
    }
    EXPECT_FALSE(loggedErrors());
}
