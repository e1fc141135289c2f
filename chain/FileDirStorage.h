#ifndef HASHCHAIN_FILE_DIR_STORAGE_H
#define HASHCHAIN_FILE_DIR_STORAGE_H

#include "BlockStorage.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hc {

/**
 * FileDirStorage stores one chain in a directory.
 *
 * Layout:
 * - <index>.<hash>  one file per block, holding the block JSON
 * - chain.json      chain metadata {name, height}
 *
 * Files not matching the block name pattern are ignored, which includes the
 * temporary files left by an interrupted write. The directory is scanned on
 * open() to build the hash and position lookup tables.
 */
class FileDirStorage : public BlockStorage {
public:
  static constexpr const char *METADATA_FILE = "chain.json";

  struct Config {
    std::string dirPath;
  };

  explicit FileDirStorage(const Config &config);
  ~FileDirStorage() override;

  /**
   * Create the directory if needed and scan existing block files
   */
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

  const std::string &getDirPath() const { return config_.dirPath; }
  size_t getBlockCount() const;

  /**
   * @return true if fileName has the form <digits>.<hex>0000
   */
  static bool isBlockFileName(const std::string &fileName);
  static std::string blockFileName(uint64_t index, const std::string &hash);

private:
  Roe<void> checkOpen() const;
  Roe<void> scanDirectory();
  Roe<Block> readBlockFile(const std::string &fileName) const;
  Roe<void> removeFile(const std::string &fileName);
  std::string pathOf(const std::string &fileName) const;

  Config config_;
  mutable std::mutex mutex_;
  bool isOpen_{ false };
  // hash -> file name
  std::unordered_map<std::string, std::string> fileByHash_;
  std::map<uint64_t, std::string> hashByPosition_;
};

} // namespace hc

#endif // HASHCHAIN_FILE_DIR_STORAGE_H
