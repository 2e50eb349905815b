#include "gtest/gtest.h"
#include "chunkvault/chunk_store.h"
#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <future>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

using namespace chunkvault;
using chunkvault::testing::FixedLedger;
using chunkvault::testing::ScratchDir;
using chunkvault::testing::digestOf;
using chunkvault::testing::readFile;
using chunkvault::testing::toBytes;

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(registry_.ensureSession("alice", "s1", "data.bin", "docs", 3).ok());
    }

    Result<std::uint64_t> put(std::uint32_t index, const std::string& payload) {
        auto bytes = toBytes(payload);
        return store_.putChunk("alice", "s1", index, bytes, digestOf(bytes));
    }

    ScratchDir dir_;
    FixedLedger ledger_{1000};
    Workspace workspace_{dir_.path()};
    SessionRegistry registry_{workspace_};
    QuotaAccountant quota_{ledger_};
    ChunkStore store_{workspace_, registry_, quota_};
};

TEST_F(ChunkStoreTest, StoresChunkAndChargesQuota) {
    auto stored = put(1, "hello");
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value(), 5u);
    EXPECT_EQ(store_.listIndices("alice", "s1"), (std::vector<std::uint32_t>{1}));
    EXPECT_EQ(quota_.usage("alice").usedBytes, 5u);
    EXPECT_EQ(readFile(workspace_.chunkPath("alice", "s1", 1)), "hello");
}

TEST_F(ChunkStoreTest, IndexOutsideDeclaredRange) {
    auto stored = put(3, "x");
    ASSERT_FALSE(stored.ok());
    EXPECT_EQ(stored.code(), ErrorCode::InvalidIndex);
    EXPECT_TRUE(store_.listIndices("alice", "s1").empty());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 0u);
}

TEST_F(ChunkStoreTest, ChecksumMismatchChangesNothing) {
    ASSERT_TRUE(put(0, "first").ok());
    auto bytes = toBytes("second");
    auto stored = store_.putChunk("alice", "s1", 0, bytes, digestOf(toBytes("tampered")));
    ASSERT_FALSE(stored.ok());
    EXPECT_EQ(stored.code(), ErrorCode::ChecksumMismatch);
    EXPECT_EQ(store_.listIndices("alice", "s1"), (std::vector<std::uint32_t>{0}));
    EXPECT_EQ(quota_.usage("alice").usedBytes, 5u);
    EXPECT_EQ(readFile(workspace_.chunkPath("alice", "s1", 0)), "first");
}

TEST_F(ChunkStoreTest, OverwriteChargesOnlyTheDifference) {
    ASSERT_TRUE(put(0, std::string(100, 'a')).ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 100u);
    ASSERT_TRUE(put(0, std::string(160, 'b')).ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 160u);
    ASSERT_TRUE(put(0, std::string(40, 'c')).ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 40u);
    // Idempotent retry.
    ASSERT_TRUE(put(0, std::string(40, 'c')).ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 40u);
    EXPECT_EQ(readFile(workspace_.chunkPath("alice", "s1", 0)), std::string(40, 'c'));
}

TEST_F(ChunkStoreTest, OverwriteNearCeilingUsesDelta) {
    ASSERT_TRUE(put(0, std::string(900, 'a')).ok());
    // 950 alone would not fit next to 900, the 50 byte delta does.
    ASSERT_TRUE(put(0, std::string(950, 'b')).ok());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 950u);
    auto over = put(1, std::string(51, 'c'));
    ASSERT_FALSE(over.ok());
    EXPECT_EQ(over.code(), ErrorCode::QuotaExceeded);
    EXPECT_FALSE(std::filesystem::exists(workspace_.chunkPath("alice", "s1", 1)));
}

TEST_F(ChunkStoreTest, UnknownSessionIsNotFound) {
    auto bytes = toBytes("x");
    auto stored = store_.putChunk("alice", "missing", 0, bytes, digestOf(bytes));
    EXPECT_EQ(stored.code(), ErrorCode::SessionNotFound);
}

TEST_F(ChunkStoreTest, CancelledWriteLeavesNoTrace) {
    CancellationToken token;
    token.cancel();
    auto bytes = toBytes("payload");
    auto stored = store_.putChunk("alice", "s1", 0, bytes, digestOf(bytes), &token);
    ASSERT_FALSE(stored.ok());
    EXPECT_EQ(stored.code(), ErrorCode::Cancelled);
    EXPECT_TRUE(store_.listIndices("alice", "s1").empty());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 0u);
    EXPECT_TRUE(quota_.reserve("alice", 1000).ok());
}

TEST_F(ChunkStoreTest, ConcurrentWritersToSameIndexSerialise) {
    std::vector<std::string> payloads;
    for (int i = 0; i < 8; ++i) payloads.push_back(std::string(10 + i * 7, static_cast<char>('a' + i)));

    std::vector<std::thread> writers;
    for (const auto& payload : payloads) {
        writers.emplace_back([this, payload] {
            for (int round = 0; round < 20; ++round) {
                auto r = put(2, payload);
                EXPECT_TRUE(r.ok());
            }
        });
    }
    for (auto& w : writers) w.join();

    // Exactly one payload survives and usage equals its size.
    const std::string stored = readFile(workspace_.chunkPath("alice", "s1", 2));
    bool matchesOne = false;
    for (const auto& payload : payloads) matchesOne = matchesOne || stored == payload;
    EXPECT_TRUE(matchesOne);
    EXPECT_EQ(quota_.usage("alice").usedBytes, stored.size());
    EXPECT_EQ(store_.listIndices("alice", "s1"), (std::vector<std::uint32_t>{2}));
}

TEST_F(ChunkStoreTest, ConcurrentWritersToDifferentIndices) {
    std::vector<std::thread> writers;
    for (std::uint32_t i = 0; i < 3; ++i) {
        writers.emplace_back([this, i] { EXPECT_TRUE(put(i, std::string(10, 'x')).ok()); });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(store_.listIndices("alice", "s1"), (std::vector<std::uint32_t>{0, 1, 2}));
    EXPECT_EQ(quota_.usage("alice").usedBytes, 30u);
    EXPECT_EQ(store_.storedBytes("alice", "s1"), 30u);
}

TEST_F(ChunkStoreTest, WritesToOtherSessionsProceedDuringExclusiveHold) {
    for (int i = 0; i < 128; ++i)
        ASSERT_TRUE(registry_.ensureSession("bob", "s" + std::to_string(i), "b.bin", "docs", 1).ok());

    // What a long merge of alice/s1 holds.
    auto merging = workspace_.sessionLock("alice", "s1");
    std::unique_lock<std::shared_mutex> exclusive(merging.mutex());

    auto writes = std::async(std::launch::async, [this] {
        std::size_t stored = 0;
        for (int i = 0; i < 128; ++i) {
            auto bytes = toBytes("b");
            if (store_.putChunk("bob", "s" + std::to_string(i), 0, bytes, digestOf(bytes)).ok()) ++stored;
        }
        return stored;
    });
    const bool finished = writes.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    exclusive.unlock();
    EXPECT_TRUE(finished);
    EXPECT_EQ(writes.get(), 128u);
    EXPECT_EQ(quota_.usage("bob").usedBytes, 128u);
}

TEST_F(ChunkStoreTest, ReadOrderedReportsMissingIndices) {
    ASSERT_TRUE(put(1, "b").ok());
    auto cursor = store_.readOrdered("alice", "s1", 3);
    ASSERT_FALSE(cursor.ok());
    EXPECT_EQ(cursor.code(), ErrorCode::IncompleteUpload);
    EXPECT_EQ(cursor.error().missingIndices, (std::vector<std::uint32_t>{0, 2}));
}

TEST_F(ChunkStoreTest, ReadOrderedIsRestartable) {
    ASSERT_TRUE(put(2, "cc").ok());
    ASSERT_TRUE(put(0, "a").ok());
    ASSERT_TRUE(put(1, "bbb").ok());
    auto cursor = store_.readOrdered("alice", "s1", 3);
    ASSERT_TRUE(cursor.ok());

    auto drain = [](ChunkCursor& c) {
        std::string out;
        std::vector<std::byte> buf;
        while (true) {
            auto more = c.next(buf);
            EXPECT_TRUE(more.ok());
            if (!more.ok() || !more.value()) break;
            out.append(reinterpret_cast<const char*>(buf.data()), buf.size());
        }
        return out;
    };
    EXPECT_EQ(drain(cursor.value()), "abbbcc");
    cursor.value().rewind();
    EXPECT_EQ(cursor.value().position(), 0u);
    EXPECT_EQ(drain(cursor.value()), "abbbcc");
}

TEST_F(ChunkStoreTest, CursorReportsChunkThatVanished) {
    ASSERT_TRUE(put(0, "a").ok());
    ASSERT_TRUE(put(1, "b").ok());
    ASSERT_TRUE(put(2, "c").ok());
    auto cursor = store_.readOrdered("alice", "s1", 3);
    ASSERT_TRUE(cursor.ok());
    std::filesystem::remove(workspace_.chunkPath("alice", "s1", 1));
    std::vector<std::byte> buf;
    EXPECT_TRUE(cursor.value().next(buf).value());
    auto failed = cursor.value().next(buf);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.code(), ErrorCode::IncompleteUpload);
    EXPECT_EQ(failed.error().missingIndices, (std::vector<std::uint32_t>{1}));
}

TEST_F(ChunkStoreTest, DiscardIsIdempotentAndLeavesQuotaAlone) {
    ASSERT_TRUE(put(0, "aaaa").ok());
    ASSERT_TRUE(put(2, "bb").ok());
    auto freed = store_.discard("alice", "s1");
    ASSERT_TRUE(freed.ok());
    EXPECT_EQ(freed.value(), 6u);
    EXPECT_TRUE(store_.listIndices("alice", "s1").empty());
    EXPECT_EQ(quota_.usage("alice").usedBytes, 6u);
    EXPECT_EQ(store_.discard("alice", "s1").value(), 0u);
    EXPECT_EQ(store_.discard("alice", "never-created").value(), 0u);
}
