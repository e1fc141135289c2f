#include "MemoryStorage.h"
#include "OperationLog.h"
#include <gtest/gtest.h>

namespace {

// Memory storage whose writes start failing after a number of successes
class FlakyStorage : public hc::MemoryStorage {
public:
    Roe<std::string> persistBlock(const hc::Block &block,
                                  uint64_t positionHint) override {
        if (remainingWrites == 0) {
            return Error(hc::E_STORAGE_FAILURE, "disk full");
        }
        --remainingWrites;
        persisted.push_back(block.getHash());
        return hc::MemoryStorage::persistBlock(block, positionHint);
    }

    int remainingWrites{ 1000 };
    std::vector<std::string> persisted;
};

} // namespace

class OperationLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        hashFunction = hc::makeHashFunction(hc::HashAlgorithm::SHA256);
        std::string previous = hc::genesisHash(hashFunction);
        for (int i = 0; i < 4; ++i) {
            auto block = hc::Block::create(i, previous, "", hashFunction);
            ASSERT_TRUE(block.isOk()) << block.error().message;
            previous = block->getHash();
            blocks.push_back(block.value());
        }
        storage.setHashFunction(hashFunction);
        ASSERT_TRUE(storage.open().isOk());
    }

    hc::HashFunction hashFunction;
    std::vector<hc::Block> blocks;
    FlakyStorage storage;
};

TEST_F(OperationLogTest, RecordsInOrder) {
    hc::OperationLog log;
    EXPECT_TRUE(log.empty());

    log.recordAdd(blocks[0], 0);
    log.recordAdd(blocks[1], 1);
    log.recordDelete({ blocks[1] }, 1);
    log.recordDelete({}, 1);

    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log.getOperations()[0].kind, hc::OperationLog::Kind::ADD);
    EXPECT_EQ(log.getOperations()[1].position, 1u);
    EXPECT_EQ(log.getOperations()[2].kind, hc::OperationLog::Kind::DELETE);
    EXPECT_EQ(hc::OperationLog::toString(hc::OperationLog::Kind::DELETE), "DELETE");
}

TEST_F(OperationLogTest, ReplayAppliesAddsAndDeletes) {
    hc::OperationLog log;
    for (size_t i = 0; i < blocks.size(); ++i) {
        log.recordAdd(blocks[i], i);
    }
    log.recordDelete({ blocks[2], blocks[3] }, 2);

    auto result = log.replay(storage);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_TRUE(log.empty());

    EXPECT_EQ(storage.getBlockCount(), 2u);
    EXPECT_TRUE(storage.findBlock(blocks[1].getHash()).isOk());
    EXPECT_TRUE(storage.findBlock(blocks[2].getHash()).isError());
    auto second = storage.findBlock(uint64_t{ 1 });
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(second->getHash(), blocks[1].getHash());
}

TEST_F(OperationLogTest, FailedReplayKeepsUnappliedOperations) {
    hc::OperationLog log;
    for (size_t i = 0; i < blocks.size(); ++i) {
        log.recordAdd(blocks[i], i);
    }
    storage.remainingWrites = 2;

    auto result = log.replay(storage);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_STORAGE_FAILURE);
    EXPECT_NE(result.error().message.find(blocks[2].getHash()), std::string::npos);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.getOperations().front().blocks.front().getHash(),
              blocks[2].getHash());

    storage.remainingWrites = 1000;
    ASSERT_TRUE(log.replay(storage).isOk());
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(storage.getBlockCount(), 4u);
    ASSERT_EQ(storage.persisted.size(), 4u);
    for (size_t i = 0; i < blocks.size(); ++i) {
        EXPECT_EQ(storage.persisted[i], blocks[i].getHash());
    }
}

TEST_F(OperationLogTest, PartiallyAppliedDeleteResumes) {
    hc::OperationLog log;
    for (size_t i = 0; i < blocks.size(); ++i) {
        log.recordAdd(blocks[i], i);
    }
    ASSERT_TRUE(log.replay(storage).isOk());

    // blocks[2] is already gone from the storage, so the delete stops there
    ASSERT_TRUE(storage.deleteBlock(blocks[2].getHash()).isOk());
    log.recordDelete({ blocks[1], blocks[2], blocks[3] }, 1);

    auto result = log.replay(storage);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_HASH_NOT_FOUND);
    ASSERT_EQ(log.size(), 1u);
    const auto &remaining = log.getOperations().front();
    ASSERT_EQ(remaining.blocks.size(), 2u);
    EXPECT_EQ(remaining.blocks.front().getHash(), blocks[2].getHash());
    EXPECT_EQ(remaining.position, 2u);
}

TEST_F(OperationLogTest, RestoreFrontKeepsOlderOperationsFirst) {
    hc::OperationLog log;
    log.recordAdd(blocks[0], 0);
    auto taken = log.takeAll();
    EXPECT_TRUE(log.empty());

    log.recordAdd(blocks[1], 1);
    log.restoreFront(std::move(taken));

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.getOperations()[0].blocks.front().getHash(), blocks[0].getHash());
    EXPECT_EQ(log.getOperations()[1].blocks.front().getHash(), blocks[1].getHash());
}
