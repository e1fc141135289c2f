#include "Block.h"
#include <gtest/gtest.h>

#include <atomic>
#include <limits>

class BlockTest : public ::testing::Test {
protected:
    void SetUp() override {
        hashFunction = hc::makeHashFunction(hc::HashAlgorithm::SHA256);
        genesis = hc::genesisHash(hashFunction);
    }

    hc::Block mine(const nlohmann::json &payload, const std::string &previous,
                   const std::string &salt = "") {
        auto result = hc::Block::create(payload, previous, salt, hashFunction);
        EXPECT_TRUE(result.isOk()) << result.error().message;
        return result.value();
    }

    hc::HashFunction hashFunction;
    std::string genesis;
};

TEST_F(BlockTest, MinedBlockSatisfiesDifficulty) {
    auto block = mine({ { "from", "a" }, { "to", "b" }, { "amount", 5 } }, genesis);

    EXPECT_TRUE(hc::hasDifficultySuffix(block.getHash()));
    EXPECT_EQ(block.getHash(), block.calculateHash());
    EXPECT_EQ(block.getPrevious(), genesis);
    EXPECT_EQ(block.getSalt().size(), hc::Block::SALT_BYTES * 2);
    EXPECT_TRUE(block.verify(true));
    EXPECT_TRUE(block.verify(false));
}

TEST_F(BlockTest, HashCoversCanonicalEncoding) {
    auto block = mine(nlohmann::json::array({ 1, 2, 3 }), genesis, "00ff");
    std::string encoding = hc::Block::canonicalEncoding(
        block.getPayload(), block.getNonce(), block.getPrevious(), block.getSalt());
    EXPECT_EQ(hashFunction(encoding), block.getHash());
    EXPECT_EQ(encoding.rfind("{\"data\":[1,2,3],\"nonce\":", 0), 0u);
}

TEST_F(BlockTest, FixedSaltIsDeterministic) {
    auto a = mine("payload", genesis, "cafe");
    auto b = mine("payload", genesis, "cafe");
    EXPECT_EQ(a.getNonce(), b.getNonce());
    EXPECT_EQ(a.getHash(), b.getHash());
    EXPECT_TRUE(a.equals(b, false));
}

TEST_F(BlockTest, RandomSaltsDiffer) {
    auto a = mine("payload", genesis);
    auto b = mine("payload", genesis);
    EXPECT_NE(a.getSalt(), b.getSalt());
}

TEST_F(BlockTest, EmptyPreviousIsRejected) {
    auto result = hc::Block::create("payload", "", "", hashFunction);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_INVALID_ARGUMENT);
}

TEST_F(BlockTest, MiningStopsAtMaxNonce) {
    auto reference = mine("bounded", genesis, "beef");
    if (reference.getNonce() == 0) {
        GTEST_SKIP() << "Nonce 0 already satisfies the difficulty";
    }

    hc::Block::MiningOptions options;
    options.maxNonce = reference.getNonce() - 1;
    auto result = hc::Block::create("bounded", genesis, "beef", hashFunction, options);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_MINING_EXHAUSTED);

    options.maxNonce = reference.getNonce();
    auto found = hc::Block::create("bounded", genesis, "beef", hashFunction, options);
    ASSERT_TRUE(found.isOk()) << found.error().message;
    EXPECT_EQ(found->getHash(), reference.getHash());
}

TEST_F(BlockTest, MiningCanBeCancelled) {
    std::atomic<bool> cancel{ true };
    hc::Block::MiningOptions options;
    options.cancel = &cancel;
    auto result = hc::Block::create("cancelled", genesis, "", hashFunction, options);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_MINING_CANCELLED);
}

TEST(MiningOptionsTest, DefaultsAreUnbounded) {
    hc::Block::MiningOptions options;
    EXPECT_EQ(options.maxNonce, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(options.cancel, nullptr);
}

TEST(SaltTest, GeneratedSaltIsHex) {
    auto salt = hc::Block::generateSalt();
    ASSERT_TRUE(salt.isOk()) << salt.error().message;
    EXPECT_EQ(salt->size(), hc::Block::SALT_BYTES * 2);
}

TEST(SaltTest, RandomSourceFailureIsEntropyError) {
    auto salt = hc::Block::generateSalt(
        static_cast<size_t>(std::numeric_limits<int>::max()) + 1);
    ASSERT_TRUE(salt.isError());
    EXPECT_EQ(salt.error().code, hc::E_ENTROPY);
}

TEST_F(BlockTest, SetPayloadRemines) {
    auto block = mine("before", genesis);
    std::string oldHash = block.getHash();

    auto result = block.setPayload("after");
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(block.getPayload(), "after");
    EXPECT_NE(block.getHash(), oldHash);
    EXPECT_TRUE(block.verify(false));
}

TEST_F(BlockTest, FailedSetPayloadLeavesBlockUnchanged) {
    auto block = mine("before", genesis);
    std::string oldHash = block.getHash();

    std::atomic<bool> cancel{ true };
    hc::Block::MiningOptions options;
    options.cancel = &cancel;
    auto result = block.setPayload("after", options);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(block.getPayload(), "before");
    EXPECT_EQ(block.getHash(), oldHash);
}

TEST_F(BlockTest, SetPreviousRelinksAndRemines) {
    auto first = mine("first", genesis);
    auto second = mine("second", genesis);
    ASSERT_TRUE(second.setPrevious(first.getHash()).isOk());
    EXPECT_EQ(second.getPrevious(), first.getHash());
    EXPECT_TRUE(second.verify(false));

    std::string hash = second.getHash();
    ASSERT_TRUE(second.setPrevious(first.getHash()).isOk());
    EXPECT_EQ(second.getHash(), hash);

    EXPECT_TRUE(second.setPrevious("").isError());
}

TEST_F(BlockTest, QuickVerifyMissesPayloadTampering) {
    auto block = mine("honest", genesis);
    nlohmann::json stored = block.ltsToJson();
    stored["data"] = "tampered";

    auto tampered = hc::Block::ltsFromJson(stored, hashFunction);
    ASSERT_TRUE(tampered.isOk()) << tampered.error().message;
    EXPECT_TRUE(tampered->verify(true));
    EXPECT_FALSE(tampered->verify(false));
}

TEST_F(BlockTest, StoredFormRestoresBlock) {
    auto block = mine({ { "k", "v" } }, genesis);
    auto restored = hc::Block::ltsFromString(block.ltsToString(), hashFunction);
    ASSERT_TRUE(restored.isOk()) << restored.error().message;
    EXPECT_TRUE(restored->equals(block, false));
    EXPECT_TRUE(restored->verify(false));

    nlohmann::json stored = block.ltsToJson();
    for (const char *key : { "data", "hash", "nonce", "previous", "salt" }) {
        EXPECT_TRUE(stored.contains(key)) << key;
    }
}

TEST_F(BlockTest, MalformedStoredFormIsRejected) {
    auto notJson = hc::Block::ltsFromString("{broken", hashFunction);
    ASSERT_TRUE(notJson.isError());
    EXPECT_EQ(notJson.error().code, hc::E_MALFORMED_BLOCK);

    auto block = mine("x", genesis);
    nlohmann::json missingSalt = block.ltsToJson();
    missingSalt.erase("salt");
    auto result = hc::Block::ltsFromJson(missingSalt, hashFunction);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, hc::E_MALFORMED_BLOCK);

    nlohmann::json negativeNonce = block.ltsToJson();
    negativeNonce["nonce"] = -1;
    EXPECT_TRUE(hc::Block::ltsFromJson(negativeNonce, hashFunction).isError());

    nlohmann::json textHash = block.ltsToJson();
    textHash["hash"] = "not-a-digest";
    auto badHash = hc::Block::ltsFromJson(textHash, hashFunction);
    ASSERT_TRUE(badHash.isError());
    EXPECT_EQ(badHash.error().code, hc::E_MALFORMED_BLOCK);

    EXPECT_TRUE(hc::Block::ltsFromJson(nlohmann::json::array(), hashFunction).isError());
}

TEST_F(BlockTest, EqualsUsesComparatorWhenGiven) {
    auto a = mine("a", genesis);
    auto b = mine("b", genesis);
    EXPECT_FALSE(a.equals(b));

    bool seenQuick = false;
    auto always = [&seenQuick](const hc::Block &, const hc::Block &, bool quick) {
        seenQuick = quick;
        return true;
    };
    EXPECT_TRUE(a.equals(b, true, always));
    EXPECT_TRUE(seenQuick);
}
