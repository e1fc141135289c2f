#include "MemoryStorage.h"

namespace hc {

MemoryStorage::MemoryStorage() : BlockStorage("storage.memory") {}

MemoryStorage::Roe<void> MemoryStorage::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  isOpen_ = true;
  return {};
}

void MemoryStorage::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  isOpen_ = false;
}

bool MemoryStorage::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isOpen_;
}

MemoryStorage::Roe<void> MemoryStorage::checkOpen() const {
  if (!isOpen_) {
    return Error(E_STORAGE_FAILURE, "Storage is not open");
  }
  return {};
}

void MemoryStorage::unmapPosition(uint64_t position, const std::string &hash) {
  auto it = hashByPosition_.find(position);
  if (it != hashByPosition_.end() && it->second == hash) {
    hashByPosition_.erase(it);
  }
}

MemoryStorage::Roe<Block> MemoryStorage::decode(const Record &record) const {
  auto result = Block::ltsFromString(record.data, getHashFunction());
  if (!result) {
    return Error(E_STORAGE_FAILURE,
                 "Corrupt block record: " + result.error().message);
  }
  return result.value();
}

MemoryStorage::Roe<Block>
MemoryStorage::findBlock(const std::string &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = records_.find(hash);
  if (it == records_.end()) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }
  return decode(it->second);
}

MemoryStorage::Roe<Block> MemoryStorage::findBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = hashByPosition_.find(index);
  if (it == hashByPosition_.end()) {
    return Error(E_INDEX_NOT_FOUND,
                 "No block at position " + std::to_string(index));
  }
  return decode(records_.at(it->second));
}

MemoryStorage::Roe<std::string>
MemoryStorage::persistBlock(const Block &block, uint64_t positionHint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  const std::string &hash = block.getHash();
  auto existing = records_.find(hash);
  if (existing != records_.end()) {
    unmapPosition(existing->second.position, hash);
  }
  // The position is a lookup hint; a block already there keeps its record
  auto displaced = hashByPosition_.find(positionHint);
  if (displaced != hashByPosition_.end() && displaced->second != hash) {
    log().warning << "Position " << positionHint << " moves from block "
                  << displaced->second << " to " << hash;
  }

  Record record;
  record.position = positionHint;
  record.data = block.ltsToString();
  records_[hash] = std::move(record);
  hashByPosition_[positionHint] = hash;

  log().debug << "Persisted block " << positionHint << " " << hash;
  return hash;
}

MemoryStorage::Roe<std::string>
MemoryStorage::deleteBlock(const std::string &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = records_.find(hash);
  if (it == records_.end()) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }
  unmapPosition(it->second.position, hash);
  records_.erase(it);

  log().debug << "Deleted block " << hash;
  return hash;
}

MemoryStorage::Roe<BlockStorage::ChainMeta>
MemoryStorage::loadChainMetadata(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = metadata_.find(name);
  if (it == metadata_.end()) {
    return Error(E_CHAIN_NOT_FOUND, "Chain not found: " + name);
  }
  return it->second;
}

MemoryStorage::Roe<void> MemoryStorage::saveChainMetadata(const ChainMeta &meta) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  metadata_[meta.name] = meta;
  return {};
}

MemoryStorage::Roe<std::vector<Block>> MemoryStorage::loadBlocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  std::vector<Block> blocks;
  blocks.reserve(records_.size());
  for (const auto &[hash, record] : records_) {
    auto result = decode(record);
    if (!result) {
      return result.error();
    }
    blocks.push_back(result.value());
  }
  return blocks;
}

size_t MemoryStorage::getBlockCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void MemoryStorage::putRecord(const std::string &hash, uint64_t position,
                              const std::string &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = records_.find(hash);
  if (existing != records_.end()) {
    unmapPosition(existing->second.position, hash);
  }
  records_[hash] = Record{ position, record };
  hashByPosition_[position] = hash;
}

} // namespace hc
