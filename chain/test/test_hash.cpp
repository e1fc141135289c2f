#include "Hash.h"
#include <gtest/gtest.h>

TEST(HashTest, Sha256OfEmptyInput) {
    EXPECT_EQ(hc::digestHex(hc::HashAlgorithm::SHA256, ""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashTest, Sha1OfEmptyInput) {
    EXPECT_EQ(hc::digestHex(hc::HashAlgorithm::SHA1, ""),
              "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(HashTest, Sha256OfKnownInput) {
    EXPECT_EQ(hc::digestHex(hc::HashAlgorithm::SHA256, "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, HashFunctionMatchesDigest) {
    auto hashFunction = hc::makeHashFunction(hc::HashAlgorithm::SHA512);
    EXPECT_EQ(hashFunction("block"),
              hc::digestHex(hc::HashAlgorithm::SHA512, "block"));
    EXPECT_EQ(hashFunction("block").size(), 128u);
}

TEST(HashTest, GenesisHashMatchesDigestLength) {
    auto sha256 = hc::genesisHash(hc::makeHashFunction(hc::HashAlgorithm::SHA256));
    EXPECT_EQ(sha256, std::string(64, '0'));

    auto sha1 = hc::genesisHash(hc::makeHashFunction(hc::HashAlgorithm::SHA1));
    EXPECT_EQ(sha1, std::string(40, '0'));

    EXPECT_EQ(hc::genesisHash({}), std::string(64, '0'));
}

TEST(HashTest, AlgorithmNamesRoundTrip) {
    for (auto algorithm : { hc::HashAlgorithm::SHA1, hc::HashAlgorithm::SHA224,
                            hc::HashAlgorithm::SHA256, hc::HashAlgorithm::SHA384,
                            hc::HashAlgorithm::SHA512 }) {
        auto parsed = hc::parseHashAlgorithm(hc::toString(algorithm));
        ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
        EXPECT_EQ(parsed.value(), algorithm);
    }
}

TEST(HashTest, UnknownAlgorithmIsRejected) {
    auto parsed = hc::parseHashAlgorithm("md5");
    ASSERT_TRUE(parsed.isError());
    EXPECT_EQ(parsed.error().code, hc::E_INVALID_ARGUMENT);
}

TEST(HashTest, DifficultySuffix) {
    EXPECT_TRUE(hc::hasDifficultySuffix("abc0000"));
    EXPECT_TRUE(hc::hasDifficultySuffix("0000"));
    EXPECT_FALSE(hc::hasDifficultySuffix("abc000"));
    EXPECT_FALSE(hc::hasDifficultySuffix("000"));
}
