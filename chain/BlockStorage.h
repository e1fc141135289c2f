#ifndef HASHCHAIN_BLOCK_STORAGE_H
#define HASHCHAIN_BLOCK_STORAGE_H

#include "Block.h"
#include "Module.h"
#include "Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hc {

/**
 * BlockStorage is the abstract persistence adapter consumed by Chain.
 *
 * The chain calls it only while walking a mounted chain, while loading, and
 * while committing. Block bodies and chain metadata are separate records.
 * An adapter is opened and closed explicitly by its owner; Chain::close()
 * closes the adapter it was given.
 */
class BlockStorage : public Module {
public:
  using Error = ChainError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  /**
   * Chain metadata at rest: {name, height}
   */
  struct ChainMeta {
    std::string name;
    uint64_t height{ 0 };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  explicit BlockStorage(const std::string &name) : Module(name) {}
  ~BlockStorage() override = default;

  virtual Roe<void> open() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  /**
   * @return The stored block with that hash, or E_HASH_NOT_FOUND
   */
  virtual Roe<Block> findBlock(const std::string &hash) const = 0;

  /**
   * @return The block stored at that chain position, or E_INDEX_NOT_FOUND
   */
  virtual Roe<Block> findBlock(uint64_t index) const = 0;

  /**
   * Store a block
   * @param block Block to store
   * @param positionHint Position of the block in its chain
   * @return Adapter specific id of the stored record
   */
  virtual Roe<std::string> persistBlock(const Block &block,
                                        uint64_t positionHint) = 0;

  /**
   * Remove a stored block
   * @return Adapter specific id of the removed record, or E_HASH_NOT_FOUND
   */
  virtual Roe<std::string> deleteBlock(const std::string &hash) = 0;

  /**
   * @return Metadata saved under that name, or E_CHAIN_NOT_FOUND
   */
  virtual Roe<ChainMeta> loadChainMetadata(const std::string &name) const = 0;
  virtual Roe<void> saveChainMetadata(const ChainMeta &meta) = 0;

  /**
   * @return Every stored block, in no particular order
   */
  virtual Roe<std::vector<Block>> loadBlocks() const = 0;

  /**
   * Digest attached to blocks restored from this storage
   */
  void setHashFunction(HashFunction hashFunction) {
    hashFunction_ = std::move(hashFunction);
  }
  const HashFunction &getHashFunction() const { return hashFunction_; }

private:
  HashFunction hashFunction_;
};

} // namespace hc

#endif // HASHCHAIN_BLOCK_STORAGE_H
