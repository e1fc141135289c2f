#include "Chain.h"
#include "MemoryStorage.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

// Memory storage whose writes start failing after a number of successes
class FlakyStorage : public hc::MemoryStorage {
public:
    Roe<std::string> persistBlock(const hc::Block &block,
                                  uint64_t positionHint) override {
        if (remainingWrites == 0) {
            return Error(hc::E_STORAGE_FAILURE, "write refused");
        }
        --remainingWrites;
        return hc::MemoryStorage::persistBlock(block, positionHint);
    }

    std::atomic<int> remainingWrites{ 1000 };
};

} // namespace

class CommitTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.name = "ledger";
        spStorage = std::make_shared<FlakyStorage>();
    }

    void grow(hc::Chain &chain, int count) {
        for (int i = 0; i < count; ++i) {
            auto block = chain.createNextBlock({ { "n", i } });
            ASSERT_TRUE(block.isOk()) << block.error().message;
            ASSERT_TRUE(chain.add(block.value()).isOk());
        }
    }

    hc::Chain::Config config;
    std::shared_ptr<FlakyStorage> spStorage;
};

TEST_F(CommitTest, CommitWritesBlocksAndMetadata) {
    hc::Chain chain(config, spStorage);
    grow(chain, 3);

    auto result = chain.commit();
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(chain.getPendingOperationCount(), 0u);
    EXPECT_TRUE(spStorage->isOpen());
    EXPECT_EQ(spStorage->getBlockCount(), 3u);

    auto meta = spStorage->loadChainMetadata("ledger");
    ASSERT_TRUE(meta.isOk());
    EXPECT_EQ(meta->height, 3u);

    // Nothing pending is still a valid commit
    EXPECT_TRUE(chain.commit().isOk());
}

TEST_F(CommitTest, CommittedDeletesRemoveStoredBlocks) {
    hc::Chain chain(config, spStorage);
    grow(chain, 4);
    ASSERT_TRUE(chain.commit().isOk());

    auto first = chain.get(uint64_t{ 0 });
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(chain.rollback(first->getHash()).isOk());
    ASSERT_TRUE(chain.commit().isOk());

    EXPECT_EQ(spStorage->getBlockCount(), 1u);
    EXPECT_EQ(spStorage->loadChainMetadata("ledger")->height, 1u);
}

TEST_F(CommitTest, AddThenDeleteBeforeCommitLeavesNothingStored) {
    hc::Chain chain(config, spStorage);
    grow(chain, 2);
    ASSERT_TRUE(chain.deleteAt(0, 2).isOk());
    EXPECT_EQ(chain.getPendingOperationCount(), 3u);

    ASSERT_TRUE(chain.commit().isOk());
    EXPECT_EQ(spStorage->getBlockCount(), 0u);
}

TEST_F(CommitTest, MiddleDeleteThenAddKeepsEveryBlockStored) {
    hc::Chain chain(config, spStorage);
    grow(chain, 3);
    ASSERT_TRUE(chain.commit().isOk());

    ASSERT_TRUE(chain.deleteAt(1, 1).isOk());
    auto pending = chain.getPendingOperations();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending.back().kind, hc::OperationLog::Kind::ADD);
    EXPECT_EQ(pending.back().position, 1u);

    grow(chain, 1);
    ASSERT_TRUE(chain.commit().isOk());
    EXPECT_EQ(chain.getHeight(), 3u);
    EXPECT_EQ(spStorage->getBlockCount(), chain.getHeight());

    // Stored positions match the chain after the shift
    for (uint64_t i = 0; i < chain.getHeight(); ++i) {
        auto stored = spStorage->findBlock(i);
        ASSERT_TRUE(stored.isOk()) << stored.error().message;
        EXPECT_EQ(stored->getHash(), chain.get(i)->getHash());
    }

    hc::Chain loaded(config, spStorage);
    ASSERT_TRUE(loaded.load().isOk());
    EXPECT_EQ(loaded.getHeight(), chain.getHeight());
    EXPECT_TRUE(loaded.equals(chain, false));
}

TEST_F(CommitTest, PersistAtOccupiedPositionKeepsOtherBlock) {
    hc::Chain chain(config);
    grow(chain, 2);
    auto blocks = chain.getBlocks();
    ASSERT_TRUE(spStorage->open().isOk());

    ASSERT_TRUE(spStorage->persistBlock(blocks[0], 0).isOk());
    ASSERT_TRUE(spStorage->persistBlock(blocks[1], 0).isOk());
    EXPECT_EQ(spStorage->getBlockCount(), 2u);
    EXPECT_TRUE(spStorage->findBlock(blocks[0].getHash()).isOk());
    EXPECT_EQ(spStorage->findBlock(uint64_t{ 0 })->getHash(), blocks[1].getHash());

    // Moving the displaced block leaves the new occupant of 0 in place
    ASSERT_TRUE(spStorage->persistBlock(blocks[0], 1).isOk());
    EXPECT_EQ(spStorage->findBlock(uint64_t{ 0 })->getHash(), blocks[1].getHash());
    EXPECT_EQ(spStorage->findBlock(uint64_t{ 1 })->getHash(), blocks[0].getHash());
}

TEST_F(CommitTest, FailedCommitKeepsUnappliedOperations) {
    hc::Chain chain(config, spStorage);
    grow(chain, 3);
    spStorage->remainingWrites = 1;

    auto result = chain.commit();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_STORAGE_FAILURE);
    EXPECT_EQ(chain.getPendingOperationCount(), 2u);
    EXPECT_EQ(spStorage->getBlockCount(), 1u);
    EXPECT_TRUE(spStorage->loadChainMetadata("ledger").isError());

    grow(chain, 1);
    auto pending = chain.getPendingOperations();
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(pending.front().position, 1u);
    EXPECT_EQ(pending.back().position, 3u);

    spStorage->remainingWrites = 1000;
    ASSERT_TRUE(chain.commit().isOk());
    EXPECT_EQ(chain.getPendingOperationCount(), 0u);
    EXPECT_EQ(spStorage->getBlockCount(), 4u);
}

TEST_F(CommitTest, LoadRestoresCommittedChain) {
    hc::Chain chain(config, spStorage);
    grow(chain, 5);
    ASSERT_TRUE(chain.commit().isOk());

    hc::Chain loaded(config, spStorage);
    auto result = loaded.load();
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(loaded.getHeight(), 5u);
    EXPECT_TRUE(loaded.isOrdered());
    EXPECT_TRUE(loaded.verify(false));
    EXPECT_TRUE(loaded.equals(chain, false));
    EXPECT_EQ(loaded.getPendingOperationCount(), 0u);
}

TEST_F(CommitTest, LoadOfUnknownChainFails) {
    hc::Chain chain(config, spStorage);
    auto result = chain.load();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_CHAIN_NOT_FOUND);

    hc::Chain detached(config);
    auto noStorage = detached.load();
    ASSERT_TRUE(noStorage.isError());
    EXPECT_EQ(noStorage.error().code, hc::E_STORAGE_FAILURE);
}

TEST_F(CommitTest, LoadReportsCorruptRecord) {
    ASSERT_TRUE(spStorage->open().isOk());
    ASSERT_TRUE(spStorage->saveChainMetadata({ "ledger", 1 }).isOk());
    spStorage->putRecord(std::string(60, 'a') + "0000", 0, "{not a block");

    hc::Chain chain(config, spStorage);
    auto result = chain.load();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_STORAGE_FAILURE);
}

TEST_F(CommitTest, MountResolvesBlocksLazily) {
    hc::Chain chain(config, spStorage);
    grow(chain, 4);
    ASSERT_TRUE(chain.commit().isOk());
    auto blocks = chain.getBlocks();

    hc::Chain mounted(config, spStorage);
    ASSERT_TRUE(mounted.mount().isOk());
    EXPECT_TRUE(mounted.isMounted());
    EXPECT_EQ(mounted.getHeight(), 4u);

    auto third = mounted.get(uint64_t{ 2 });
    ASSERT_TRUE(third.isOk()) << third.error().message;
    EXPECT_EQ(third->getHash(), blocks[2].getHash());

    auto byHash = mounted.get(blocks[3].getHash());
    ASSERT_TRUE(byHash.isOk());
    EXPECT_TRUE(byHash->equals(blocks[3], false));

    auto hashes = mounted.walk<std::string>(
        [](const hc::Block &block, uint64_t) { return block.getHash(); });
    ASSERT_TRUE(hashes.isOk());
    EXPECT_EQ(hashes->size(), 4u);
    EXPECT_TRUE(mounted.isMounted());

    // Order dependent operations load the whole block set
    EXPECT_TRUE(mounted.verify(false));
    EXPECT_FALSE(mounted.isMounted());
    EXPECT_TRUE(mounted.equals(chain));
}

TEST_F(CommitTest, MountedChainAcceptsAdds) {
    hc::Chain chain(config, spStorage);
    grow(chain, 2);
    ASSERT_TRUE(chain.commit().isOk());

    hc::Chain mounted(config, spStorage);
    ASSERT_TRUE(mounted.mount().isOk());
    grow(mounted, 1);
    EXPECT_EQ(mounted.getHeight(), 3u);
    ASSERT_TRUE(mounted.commit().isOk());
    EXPECT_EQ(spStorage->getBlockCount(), 3u);
    EXPECT_EQ(spStorage->loadChainMetadata("ledger")->height, 3u);
}

TEST_F(CommitTest, CloseCommitsPendingOperations) {
    hc::Chain chain(config, spStorage);
    grow(chain, 2);
    ASSERT_TRUE(chain.close().isOk());
    EXPECT_FALSE(spStorage->isOpen());

    ASSERT_TRUE(spStorage->open().isOk());
    EXPECT_EQ(spStorage->getBlockCount(), 2u);
}

TEST_F(CommitTest, CloneWithStorageStartsWithoutPendingWrites) {
    hc::Chain chain(config, spStorage);
    grow(chain, 2);
    auto spOther = std::make_shared<hc::MemoryStorage>();
    auto clone = chain.clone("copy", spOther);
    ASSERT_TRUE(clone.isOk());
    EXPECT_EQ(clone.value()->getStorage(), spOther);

    ASSERT_TRUE(clone.value()->commit().isOk());
    EXPECT_EQ(spOther->getBlockCount(), 0u);
    EXPECT_EQ(spOther->loadChainMetadata("copy")->height, 2u);
}

TEST_F(CommitTest, AutocommitFlushesAfterQuietPeriod) {
    config.autocommit = true;
    config.autocommitTimeoutMs = 30;
    hc::Chain chain(config, spStorage);
    ASSERT_NE(chain.getAutoCommit(), nullptr);

    grow(chain, 3);
    for (int i = 0; i < 200 && chain.getPendingOperationCount() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    EXPECT_EQ(chain.getPendingOperationCount(), 0u);
    EXPECT_EQ(spStorage->getBlockCount(), 3u);
    EXPECT_GE(chain.getAutoCommit()->getFireCount(), 1u);
    ASSERT_TRUE(chain.close().isOk());
}

TEST_F(CommitTest, AutocommitNeedsStorage) {
    config.autocommit = true;
    hc::Chain chain(config);
    EXPECT_EQ(chain.getAutoCommit(), nullptr);
}
