#include "FileDirStorage.h"
#include "Utilities.h"

#include <filesystem>
#include <regex>

namespace hc {

namespace fs = std::filesystem;

static const std::regex &blockFilePattern() {
  static const std::regex pattern("^([0-9]+)\\.([0-9a-fA-F]*0000)$");
  return pattern;
}

FileDirStorage::FileDirStorage(const Config &config)
    : BlockStorage("storage.file"), config_(config) {}

FileDirStorage::~FileDirStorage() { close(); }

bool FileDirStorage::isBlockFileName(const std::string &fileName) {
  return std::regex_match(fileName, blockFilePattern());
}

std::string FileDirStorage::blockFileName(uint64_t index,
                                          const std::string &hash) {
  return std::to_string(index) + "." + hash;
}

std::string FileDirStorage::pathOf(const std::string &fileName) const {
  return (fs::path(config_.dirPath) / fileName).string();
}

FileDirStorage::Roe<void> FileDirStorage::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (isOpen_) {
    return {};
  }
  if (config_.dirPath.empty()) {
    return Error(E_STORAGE_FAILURE, "Block directory path is empty");
  }

  std::error_code ec;
  fs::create_directories(config_.dirPath, ec);
  if (ec) {
    log().error << "Failed to create directory " << config_.dirPath << ": "
                << ec.message();
    return Error(E_STORAGE_FAILURE, "Failed to create directory " +
                                        config_.dirPath + ": " + ec.message());
  }

  auto scanResult = scanDirectory();
  if (!scanResult) {
    return scanResult;
  }
  isOpen_ = true;

  log().info << "Opened " << config_.dirPath << " with "
             << fileByHash_.size() << " block files";
  return {};
}

void FileDirStorage::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return;
  }
  isOpen_ = false;
  fileByHash_.clear();
  hashByPosition_.clear();
  log().debug << "Closed " << config_.dirPath;
}

bool FileDirStorage::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isOpen_;
}

size_t FileDirStorage::getBlockCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fileByHash_.size();
}

FileDirStorage::Roe<void> FileDirStorage::checkOpen() const {
  if (!isOpen_) {
    return Error(E_STORAGE_FAILURE,
                 "Storage " + config_.dirPath + " is not open");
  }
  return {};
}

FileDirStorage::Roe<void> FileDirStorage::scanDirectory() {
  fileByHash_.clear();
  hashByPosition_.clear();

  std::error_code ec;
  fs::directory_iterator it(config_.dirPath, ec);
  if (ec) {
    return Error(E_STORAGE_FAILURE, "Failed to list " + config_.dirPath +
                                        ": " + ec.message());
  }

  try {
    for (const auto &entry : it) {
      if (!entry.is_regular_file(ec)) {
        continue;
      }
      std::string fileName = entry.path().filename().string();
      std::smatch match;
      if (!std::regex_match(fileName, match, blockFilePattern())) {
        continue;
      }

      uint64_t position = 0;
      if (!utl::parseUInt64(match[1].str(), position)) {
        log().warning << "Ignoring block file with bad index: " << fileName;
        continue;
      }
      std::string hash = match[2].str();

      auto existing = hashByPosition_.find(position);
      if (existing != hashByPosition_.end()) {
        log().warning << "Two block files at position " << position << ": "
                      << fileByHash_[existing->second] << ", " << fileName;
      }
      fileByHash_[hash] = fileName;
      hashByPosition_[position] = hash;
    }
  } catch (const fs::filesystem_error &e) {
    return Error(E_STORAGE_FAILURE,
                 "Failed to scan " + config_.dirPath + ": " + e.what());
  }

  log().debug << "Scanned " << fileByHash_.size() << " block files";
  return {};
}

FileDirStorage::Roe<Block>
FileDirStorage::readBlockFile(const std::string &fileName) const {
  auto content = utl::readFile(pathOf(fileName));
  if (!content) {
    return Error(E_STORAGE_FAILURE, content.error().message);
  }
  auto block = Block::ltsFromString(content.value(), getHashFunction());
  if (!block) {
    return Error(E_STORAGE_FAILURE,
                 "Corrupt block file " + fileName + ": " +
                     block.error().message);
  }
  return block.value();
}

FileDirStorage::Roe<void> FileDirStorage::removeFile(const std::string &fileName) {
  std::error_code ec;
  fs::remove(pathOf(fileName), ec);
  if (ec) {
    log().error << "Failed to remove " << fileName << ": " << ec.message();
    return Error(E_STORAGE_FAILURE,
                 "Failed to remove " + fileName + ": " + ec.message());
  }
  return {};
}

FileDirStorage::Roe<Block>
FileDirStorage::findBlock(const std::string &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = fileByHash_.find(hash);
  if (it == fileByHash_.end()) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }
  return readBlockFile(it->second);
}

FileDirStorage::Roe<Block> FileDirStorage::findBlock(uint64_t index) const {
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
  return readBlockFile(fileByHash_.at(it->second));
}

FileDirStorage::Roe<std::string>
FileDirStorage::persistBlock(const Block &block, uint64_t positionHint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  const std::string &hash = block.getHash();
  std::string fileName = blockFileName(positionHint, hash);
  if (!isBlockFileName(fileName)) {
    return Error(E_INVALID_ARGUMENT, "Block hash is not a mined hex digest: " +
                                         hash);
  }

  auto writeResult =
      utl::writeFileAtomically(pathOf(fileName), block.ltsToString());
  if (!writeResult) {
    log().error << "Failed to write " << fileName << ": "
                << writeResult.error().message;
    return Error(E_STORAGE_FAILURE, writeResult.error().message);
  }

  // Same block stored earlier at another position
  auto previousFile = fileByHash_.find(hash);
  if (previousFile != fileByHash_.end() && previousFile->second != fileName) {
    auto removeResult = removeFile(previousFile->second);
    if (!removeResult) {
      return removeResult.error();
    }
    for (auto it = hashByPosition_.begin(); it != hashByPosition_.end(); ++it) {
      if (it->second == hash) {
        hashByPosition_.erase(it);
        break;
      }
    }
  }
  // Another block stored at this position keeps its file
  auto displaced = hashByPosition_.find(positionHint);
  if (displaced != hashByPosition_.end() && displaced->second != hash) {
    log().warning << "Position " << positionHint << " moves from "
                  << fileByHash_[displaced->second] << " to " << fileName;
  }

  fileByHash_[hash] = fileName;
  hashByPosition_[positionHint] = hash;

  log().debug << "Wrote block file " << fileName;
  return fileName;
}

FileDirStorage::Roe<std::string>
FileDirStorage::deleteBlock(const std::string &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  auto it = fileByHash_.find(hash);
  if (it == fileByHash_.end()) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }

  std::string fileName = it->second;
  auto removeResult = removeFile(fileName);
  if (!removeResult) {
    return removeResult.error();
  }
  fileByHash_.erase(it);
  for (auto pit = hashByPosition_.begin(); pit != hashByPosition_.end();
       ++pit) {
    if (pit->second == hash) {
      hashByPosition_.erase(pit);
      break;
    }
  }

  log().debug << "Removed block file " << fileName;
  return fileName;
}

FileDirStorage::Roe<BlockStorage::ChainMeta>
FileDirStorage::loadChainMetadata(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  std::string path = pathOf(METADATA_FILE);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Error(E_CHAIN_NOT_FOUND, "No chain metadata in " + config_.dirPath);
  }

  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_STORAGE_FAILURE, jsonResult.error().message);
  }
  ChainMeta meta;
  auto parseResult = meta.ltsFromJson(jsonResult.value());
  if (!parseResult) {
    return Error(parseResult.error().code,
                 "Invalid " + path + ": " + parseResult.error().message);
  }
  if (meta.name != name) {
    return Error(E_CHAIN_NOT_FOUND, "Directory " + config_.dirPath +
                                        " holds chain '" + meta.name +
                                        "', not '" + name + "'");
  }
  return meta;
}

FileDirStorage::Roe<void> FileDirStorage::saveChainMetadata(const ChainMeta &meta) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult;
  }
  auto writeResult = utl::writeFileAtomically(pathOf(METADATA_FILE),
                                              meta.ltsToJson().dump(2));
  if (!writeResult) {
    log().error << "Failed to save chain metadata: "
                << writeResult.error().message;
    return Error(E_STORAGE_FAILURE, writeResult.error().message);
  }
  return {};
}

FileDirStorage::Roe<std::vector<Block>> FileDirStorage::loadBlocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }
  std::vector<Block> blocks;
  blocks.reserve(fileByHash_.size());
  for (const auto &[hash, fileName] : fileByHash_) {
    auto result = readBlockFile(fileName);
    if (!result) {
      return result.error();
    }
    blocks.push_back(result.value());
  }
  return blocks;
}

} // namespace hc
