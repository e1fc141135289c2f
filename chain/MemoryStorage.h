#ifndef HASHCHAIN_MEMORY_STORAGE_H
#define HASHCHAIN_MEMORY_STORAGE_H

#include "BlockStorage.h"

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hc {

/**
 * MemoryStorage keeps serialized block records keyed by hash, a position
 * index and the chain metadata in process memory.
 *
 * Records are stored in their serialized form so that a block read back is a
 * fresh deserialization, as it would be from any other storage. Records are
 * owned by hash; persisting at an occupied position never drops the block
 * stored there.
 */
class MemoryStorage : public BlockStorage {
public:
  MemoryStorage();
  ~MemoryStorage() override = default;

  Roe<void> open() override;
  void close() override;
  bool isOpen() const override;

  Roe<Block> findBlock(const std::string &hash) const override;
  Roe<Block> findBlock(uint64_t index) const override;
  Roe<std::string> persistBlock(const Block &block,
                                uint64_t positionHint) override;
  Roe<std::string> deleteBlock(const std::string &hash) override;
  Roe<ChainMeta> loadChainMetadata(const std::string &name) const override;
  Roe<void> saveChainMetadata(const ChainMeta &meta) override;
  Roe<std::vector<Block>> loadBlocks() const override;

  size_t getBlockCount() const;

  /**
   * Store a raw record as is, bypassing serialization. Lets callers seed
   * tampered or malformed records.
   */
  void putRecord(const std::string &hash, uint64_t position,
                 const std::string &record);

private:
  struct Record {
    uint64_t position{ 0 };
    std::string data;
  };

  Roe<void> checkOpen() const;
  // Drop the position entry only while it still names hash
  void unmapPosition(uint64_t position, const std::string &hash);
  Roe<Block> decode(const Record &record) const;

  mutable std::mutex mutex_;
  bool isOpen_{ false };
  std::unordered_map<std::string, Record> records_;
  std::map<uint64_t, std::string> hashByPosition_;
  std::unordered_map<std::string, ChainMeta> metadata_;
};

} // namespace hc

#endif // HASHCHAIN_MEMORY_STORAGE_H
