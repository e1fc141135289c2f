#ifndef HASHCHAIN_CHAIN_H
#define HASHCHAIN_CHAIN_H

#include "AutoCommit.h"
#include "Block.h"
#include "BlockStorage.h"
#include "Hash.h"
#include "Module.h"
#include "OperationLog.h"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hc {

/**
 * Chain - ordered, hash-linked sequence of blocks
 *
 * Blocks live in an arena addressed by position (0 = genesis) and by hash;
 * linkage is by value through Block::getPrevious(). A chain is either ordered
 * (genesis to head) or an unordered block set waiting for its ordering pass.
 * Every order-dependent operation orders the chain first.
 *
 * Mutations are recorded in an OperationLog and written to the attached
 * BlockStorage by commit(). A mounted chain resolves blocks from the storage
 * lazily while walking and loads them all on the first order-dependent
 * operation.
 *
 * One mutex guards the arena, the lookup table, the ordered flag and the log.
 * Commits are serialized by a second mutex so that add() can run while a
 * commit replays.
 */
class Chain : public Module {
public:
  using Error = ChainError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Config {
    std::string name{ "chain" };
    HashAlgorithm hashAlgorithm{ HashAlgorithm::SHA256 };
    bool autocommit{ false };
    uint64_t autocommitTimeoutMs{ DEFAULT_AUTOCOMMIT_TIMEOUT_MS };

    nlohmann::json ltsToJson() const;
    /**
     * Absent fields keep their current value; present ones must have the
     * right type. Fails with E_CONFIG.
     */
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct WalkOptions {
    WalkOptions();

    // Hash to start from; empty means the genesis sentinel
    std::string start;
    // Stop after visiting the block with this hash
    std::string end;
    // Stop after this many visited blocks, 0 for no limit
    uint64_t limit{ 0 };
    // Visit the start block itself
    bool inclusive{ false };
  };

  /**
   * Callback of visit(); return false to stop the traversal
   */
  using Visitor = std::function<bool(const Block &, uint64_t index)>;

  explicit Chain(const Config &config,
                 std::shared_ptr<BlockStorage> storage = nullptr);

  /**
   * Preload a block set in any order
   */
  Chain(const Config &config, std::vector<Block> blocks,
        std::shared_ptr<BlockStorage> storage = nullptr);

  ~Chain() override;

  // ----- traversal -----

  /**
   * Follow the links from options.start and collect operation(block, index)
   * for every visited block. Runs under the chain mutex: operation must not
   * call back into this chain. Reaching a block without successor ends the
   * walk normally.
   * @return Collected results, E_HASH_NOT_FOUND for an unknown start, or the
   * ordering / storage error that stopped the walk
   */
  template <typename R>
  Roe<std::vector<R>>
  walk(const std::function<R(const Block &, uint64_t)> &operation,
       const WalkOptions &options = {}) {
    std::vector<R> results;
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = walkLocked(
        [&](const Block &block, uint64_t index) {
          results.push_back(operation(block, index));
          return true;
        },
        options);
    if (!result) {
      return result.error();
    }
    return results;
  }

  Roe<void> visit(const Visitor &visitor, const WalkOptions &options = {});

  Roe<Block> get(const std::string &hash);
  Roe<Block> get(uint64_t index);
  Roe<uint64_t> getIndex(const std::string &hash);

  // ----- ordering and integrity -----

  /**
   * Arrange the block set genesis to head. Runs at most one pass per chain;
   * later calls return immediately.
   */
  Roe<void> order();

  /**
   * @return true iff every block passes Block::verify(quick), the first block
   * links to the genesis sentinel and every adjacent link holds. An empty
   * chain verifies; a chain that cannot be ordered does not.
   */
  bool verify(bool quick = true);

  /**
   * Compare with another chain assumed to share a prefix. The result is as
   * long as the longer chain: std::nullopt where both agree, the longer
   * chain's block elsewhere. With a fork the result is best effort.
   */
  Roe<std::vector<std::optional<Block>>> diff(Chain &other);

  /**
   * Without target: remove the first block that fails full verification or
   * its link, and everything after it (E_NOTHING_TO_ROLLBACK if none).
   * With target: remove everything after the block with that hash.
   * @return Number of removed blocks
   */
  Roe<uint64_t> rollback(const std::optional<std::string> &target = {});

  // ----- mutation -----

  /**
   * Append a fully verifying block linked to the current head
   * @return Position of the appended block
   */
  Roe<uint64_t> add(const Block &block);

  /**
   * Remove length blocks starting at index
   * @return Removed blocks
   */
  Roe<std::vector<Block>> deleteAt(uint64_t index, uint64_t length);

  /**
   * Remove length blocks starting at the block with that hash
   */
  Roe<std::vector<Block>> deleteByHash(const std::string &hash,
                                       uint64_t length = 1);

  /**
   * Replay pending operations against the storage, then save the chain
   * metadata. Operations not applied stay pending ahead of newer ones.
   */
  Roe<void> commit();

  // ----- lifecycle -----

  /**
   * Read metadata and every block from the storage, then order them
   */
  Roe<void> load();

  /**
   * Read metadata only; blocks are resolved from the storage on demand
   */
  Roe<void> mount();

  /**
   * Independent copy with its own block sequence and an empty log
   * @param name Defaults to "<name>-CLONE"
   */
  Roe<std::unique_ptr<Chain>>
  clone(const std::string &name = "",
        std::shared_ptr<BlockStorage> storage = nullptr);

  /**
   * Same height and every block found in other by hash; when not quick the
   * payloads must match too
   */
  bool equals(Chain &other, bool quick = true);

  /**
   * Stop autocommit, commit pending operations and close the storage
   */
  Roe<void> close();

  // ----- accessors -----

  const Config &getConfig() const { return config_; }
  const std::string &getName() const { return config_.name; }
  const HashFunction &getHashFunction() const { return hashFunction_; }
  const std::string &getGenesisHash() const { return genesisHash_; }

  uint64_t getHeight() const;
  std::vector<Block> getBlocks();
  Roe<Block> getHead();

  /**
   * Mine a block linked to the current head with this chain's digest
   */
  Roe<Block> createNextBlock(nlohmann::json payload,
                             const Block::MiningOptions &options = {});

  size_t getPendingOperationCount() const;
  std::deque<OperationLog::Operation> getPendingOperations() const;

  bool isOrdered() const;
  bool isMounted() const;
  uint64_t getOrderingPassCount() const;

  const std::shared_ptr<BlockStorage> &getStorage() const { return spStorage_; }
  AutoCommit *getAutoCommit() const { return upAutoCommit_.get(); }

  /**
   * {name, height, blocks: [...]} in chain order
   */
  nlohmann::json ltsToJson();

private:
  Roe<void> walkLocked(const Visitor &visitor, const WalkOptions &options);
  Roe<const Block *> blockAtLocked(uint64_t index,
                                   std::optional<Block> &holder) const;
  Roe<uint64_t> locateLocked(const std::string &hash);

  Roe<void> orderLocked();
  Roe<void> materializeLocked();
  Roe<void> openStorageLocked();
  void rebuildIndexLocked();
  bool verifyLocked(bool quick) const;
  std::vector<Block> removeRangeLocked(uint64_t index, uint64_t length);
  std::string headHashLocked() const;

  Roe<void> commitLocked();
  bool tryAutoCommit();
  void touchAutoCommit();
  void startAutoCommit();

  Config config_;
  HashFunction hashFunction_;
  std::string genesisHash_;
  std::shared_ptr<BlockStorage> spStorage_;

  mutable std::mutex mutex_;
  std::vector<Block> blocks_;
  std::unordered_map<std::string, uint64_t> indexByHash_;
  bool ordered_{ false };
  bool mounted_{ false };
  uint64_t mountedHeight_{ 0 };
  uint64_t orderingPassCount_{ 0 };
  OperationLog operationLog_;

  std::mutex commitMutex_;

  // Declared last so that it is destroyed first
  std::unique_ptr<AutoCommit> upAutoCommit_;
};

} // namespace hc

#endif // HASHCHAIN_CHAIN_H
