#pragma once

#include "Hash.h"
#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

namespace hc {

/**
 * Block - mined unit of the chain
 *
 * Holds an opaque JSON payload, the hash of its predecessor, a random salt,
 * and the nonce found by mining. The hash covers the canonical encoding
 * {"data","nonce","previous","salt"} and always ends in DIFFICULTY_SUFFIX
 * for a mined block. Blocks never reference the chain that holds them.
 */
class Block {
public:
  using Error = ChainError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  /**
   * Equality predicate used by equals(); receives the quick flag.
   */
  using Comparator =
      std::function<bool(const Block &, const Block &, bool quick)>;

  static constexpr size_t SALT_BYTES = 8;

  struct MiningOptions {
    MiningOptions();

    // Largest nonce tried before giving up with E_MINING_EXHAUSTED
    uint64_t maxNonce{ std::numeric_limits<uint64_t>::max() };
    // Optional cooperative cancellation, polled during the search
    const std::atomic<bool> *cancel{ nullptr };
  };

  /**
   * Random hex salt, two characters per byte. Fails with E_ENTROPY.
   */
  static Roe<std::string> generateSalt(size_t byteCount = SALT_BYTES);

  /**
   * Create and mine a block
   * @param payload Opaque application data
   * @param previous Hash of the predecessor, or the genesis sentinel
   * @param salt Salt to use; a random one is generated when empty
   * @param hashFunction Digest to use; SHA-256 when empty
   * @param options Mining bounds
   * @return Mined block, or E_INVALID_ARGUMENT / E_ENTROPY /
   * E_MINING_EXHAUSTED / E_MINING_CANCELLED
   */
  static Roe<Block> create(nlohmann::json payload, const std::string &previous,
                           const std::string &salt = "",
                           HashFunction hashFunction = {},
                           const MiningOptions &options = {});

  /**
   * Restore a block from its stored form. The stored hash is trusted and not
   * recomputed; use verify(false) to check it.
   */
  static Roe<Block> ltsFromJson(const nlohmann::json &jd,
                                HashFunction hashFunction = {});
  static Roe<Block> ltsFromString(const std::string &str,
                                  HashFunction hashFunction = {});

  const nlohmann::json &getPayload() const { return payload_; }
  const std::string &getPrevious() const { return previous_; }
  const std::string &getSalt() const { return salt_; }
  uint64_t getNonce() const { return nonce_; }
  const std::string &getHash() const { return hash_; }

  /**
   * Replace the payload and re-mine. The block is unchanged on failure.
   */
  Roe<void> setPayload(nlohmann::json payload,
                       const MiningOptions &options = {});

  /**
   * Re-link the block to another predecessor and re-mine. The block is
   * unchanged on failure; setting the current value is a no-op.
   */
  Roe<void> setPrevious(const std::string &previous,
                        const MiningOptions &options = {});

  std::string calculateHash() const;

  /**
   * @param quick true: check the difficulty suffix only (does not detect
   * payload tampering). false: recompute the hash and compare.
   */
  bool verify(bool quick = true) const;

  /**
   * Compare with another block. The default comparator compares hashes when
   * quick, the full serialized form otherwise.
   */
  bool equals(const Block &other, bool quick = true,
              const Comparator &comparator = {}) const;

  /**
   * Stored form: {data, hash, nonce, previous, salt}
   */
  nlohmann::json ltsToJson() const;
  std::string ltsToString() const;

  static std::string canonicalEncoding(const nlohmann::json &payload,
                                       uint64_t nonce,
                                       const std::string &previous,
                                       const std::string &salt);

private:
  struct MiningResult {
    uint64_t nonce{ 0 };
    std::string hash;
  };

  Block() = default;

  static Roe<MiningResult> mine(const HashFunction &hashFunction,
                                const nlohmann::json &payload,
                                const std::string &previous,
                                const std::string &salt,
                                const MiningOptions &options);

  HashFunction hashFunction_;
  nlohmann::json payload_;
  std::string previous_;
  std::string salt_;
  uint64_t nonce_{ 0 };
  std::string hash_;
};

} // namespace hc
