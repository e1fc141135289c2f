#pragma once

#include "ResultOrError.hpp"
#include <cstdint>
#include <string>

namespace hc {

/**
 * Error shared by the chain engine and its storage adapters. The code is one
 * of the E_* constants below.
 */
struct ChainError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

// Wrong shape or value passed to an API
constexpr int32_t E_INVALID_ARGUMENT = 1;
// Appended block does not link to the current head
constexpr int32_t E_INVALID_PREVIOUS_LINK = 2;
// Serialized block is corrupt or misses fields
constexpr int32_t E_MALFORMED_BLOCK = 3;
// Non-empty block set without a block linking to the genesis sentinel
constexpr int32_t E_NO_GENESIS_BLOCK = 4;
constexpr int32_t E_HASH_NOT_FOUND = 5;
constexpr int32_t E_INDEX_NOT_FOUND = 6;
// Rollback without target on a chain that fully verifies
constexpr int32_t E_NOTHING_TO_ROLLBACK = 7;
// Adapter level I/O failure
constexpr int32_t E_STORAGE_FAILURE = 8;
constexpr int32_t E_MINING_EXHAUSTED = 9;
constexpr int32_t E_MINING_CANCELLED = 10;
constexpr int32_t E_CHAIN_NOT_FOUND = 11;
constexpr int32_t E_CONFIG = 12;
// The random source could not produce a salt
constexpr int32_t E_ENTROPY = 13;

// Fixed proof-of-work: every mined hash ends with this suffix
constexpr const char *DIFFICULTY_SUFFIX = "0000";
constexpr size_t DIFFICULTY_SUFFIX_LENGTH = 4;

constexpr uint64_t DEFAULT_AUTOCOMMIT_TIMEOUT_MS = 5000;

inline bool hasDifficultySuffix(const std::string &hash) {
  return hash.size() >= DIFFICULTY_SUFFIX_LENGTH &&
         hash.compare(hash.size() - DIFFICULTY_SUFFIX_LENGTH,
                      DIFFICULTY_SUFFIX_LENGTH, DIFFICULTY_SUFFIX) == 0;
}

} // namespace hc
