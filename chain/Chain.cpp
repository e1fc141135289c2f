#include "Chain.h"

#include <algorithm>

namespace hc {

// ----- Config -----

nlohmann::json Chain::Config::ltsToJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["hashAlgorithm"] = toString(hashAlgorithm);
  j["autocommit"] = autocommit;
  j["autocommitTimeoutMs"] = autocommitTimeoutMs;
  return j;
}

Chain::Roe<void> Chain::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Chain config must be a JSON object");
  }

  Config parsed = *this;
  if (jd.contains("name")) {
    if (!jd["name"].is_string() || jd["name"].get<std::string>().empty()) {
      return Error(E_CONFIG, "Field 'name' must be a non-empty string");
    }
    parsed.name = jd["name"].get<std::string>();
  }
  if (jd.contains("hashAlgorithm")) {
    if (!jd["hashAlgorithm"].is_string()) {
      return Error(E_CONFIG, "Field 'hashAlgorithm' must be a string");
    }
    auto algorithm = parseHashAlgorithm(jd["hashAlgorithm"].get<std::string>());
    if (!algorithm) {
      return Error(E_CONFIG, algorithm.error().message);
    }
    parsed.hashAlgorithm = algorithm.value();
  }
  if (jd.contains("autocommit")) {
    if (!jd["autocommit"].is_boolean()) {
      return Error(E_CONFIG, "Field 'autocommit' must be a boolean");
    }
    parsed.autocommit = jd["autocommit"].get<bool>();
  }
  if (jd.contains("autocommitTimeoutMs")) {
    if (!jd["autocommitTimeoutMs"].is_number_unsigned()) {
      return Error(E_CONFIG,
                   "Field 'autocommitTimeoutMs' must be a non-negative integer");
    }
    parsed.autocommitTimeoutMs = jd["autocommitTimeoutMs"].get<uint64_t>();
  }

  *this = parsed;
  return {};
}

// ----- construction -----

Chain::WalkOptions::WalkOptions() = default;

Chain::Chain(const Config &config, std::shared_ptr<BlockStorage> storage)
    : Chain(config, std::vector<Block>{}, std::move(storage)) {}

Chain::Chain(const Config &config, std::vector<Block> blocks,
             std::shared_ptr<BlockStorage> storage)
    : Module("chain"), config_(config),
      hashFunction_(makeHashFunction(config.hashAlgorithm)),
      genesisHash_(genesisHash(hashFunction_)), spStorage_(std::move(storage)),
      blocks_(std::move(blocks)) {
  if (spStorage_) {
    spStorage_->setHashFunction(hashFunction_);
  }
  rebuildIndexLocked();
  startAutoCommit();
}

Chain::~Chain() {
  upAutoCommit_.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!operationLog_.empty()) {
    log().warning << "Chain " << config_.name << " destroyed with "
                  << operationLog_.size() << " uncommitted operations";
  }
}

void Chain::startAutoCommit() {
  if (!config_.autocommit) {
    return;
  }
  if (!spStorage_) {
    log().warning << "Autocommit requested without storage, disabled";
    return;
  }
  upAutoCommit_ = std::make_unique<AutoCommit>(config_.autocommitTimeoutMs,
                                               [this]() { return tryAutoCommit(); });
  auto result = upAutoCommit_->start();
  if (!result) {
    log().error << "Failed to start autocommit: " << result.error().message;
    upAutoCommit_.reset();
  }
}

void Chain::touchAutoCommit() {
  if (upAutoCommit_) {
    upAutoCommit_->touch();
  }
}

bool Chain::tryAutoCommit() {
  std::unique_lock<std::mutex> commitLock(commitMutex_, std::try_to_lock);
  if (!commitLock.owns_lock()) {
    return false;
  }
  auto result = commitLocked();
  if (!result) {
    log().warning << "Autocommit failed: " << result.error();
  }
  return true;
}

// ----- arena helpers -----

void Chain::rebuildIndexLocked() {
  indexByHash_.clear();
  for (uint64_t i = 0; i < blocks_.size(); ++i) {
    indexByHash_[blocks_[i].getHash()] = i;
  }
}

std::string Chain::headHashLocked() const {
  if (blocks_.empty()) {
    return genesisHash_;
  }
  return blocks_.back().getHash();
}

Chain::Roe<void> Chain::openStorageLocked() {
  if (!spStorage_) {
    return Error(E_STORAGE_FAILURE, "No storage attached to chain " +
                                        config_.name);
  }
  if (!spStorage_->isOpen()) {
    auto result = spStorage_->open();
    if (!result) {
      return result.error();
    }
  }
  return {};
}

Chain::Roe<const Block *>
Chain::blockAtLocked(uint64_t index, std::optional<Block> &holder) const {
  if (!mounted_) {
    if (index >= blocks_.size()) {
      return static_cast<const Block *>(nullptr);
    }
    return &blocks_[index];
  }

  auto result = spStorage_->findBlock(index);
  if (!result) {
    if (result.error().code == E_INDEX_NOT_FOUND) {
      return static_cast<const Block *>(nullptr);
    }
    return result.error();
  }
  holder = std::move(result.value());
  return &*holder;
}

// ----- traversal -----

Chain::Roe<void> Chain::walkLocked(const Visitor &visitor,
                                   const WalkOptions &options) {
  if (!mounted_) {
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered;
    }
  }

  std::string current = genesisHash_;
  uint64_t position = 0;
  bool includeFirst = false;
  if (!options.start.empty() && options.start != genesisHash_) {
    auto located = locateLocked(options.start);
    if (!located) {
      return located.error();
    }
    current = options.start;
    position = options.inclusive ? located.value() : located.value() + 1;
    includeFirst = options.inclusive;
  }

  std::optional<Block> holder;
  uint64_t visited = 0;
  for (;; ++position) {
    auto fetched = blockAtLocked(position, holder);
    if (!fetched) {
      return fetched.error();
    }
    const Block *block = fetched.value();
    if (!block) {
      break;
    }
    if (includeFirst) {
      includeFirst = false;
    } else if (block->getPrevious() != current) {
      break;
    }
    current = block->getHash();

    ++visited;
    if (!visitor(*block, position)) {
      break;
    }
    if (!options.end.empty() && current == options.end) {
      break;
    }
    if (options.limit > 0 && visited >= options.limit) {
      break;
    }
  }
  return {};
}

Chain::Roe<uint64_t> Chain::locateLocked(const std::string &hash) {
  if (!mounted_) {
    auto it = indexByHash_.find(hash);
    if (it == indexByHash_.end()) {
      return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
    }
    return it->second;
  }

  // Lazy chain: follow the links from genesis until the hash shows up
  std::optional<Block> holder;
  std::string current = genesisHash_;
  for (uint64_t position = 0;; ++position) {
    auto fetched = blockAtLocked(position, holder);
    if (!fetched) {
      return fetched.error();
    }
    const Block *block = fetched.value();
    if (!block || block->getPrevious() != current) {
      break;
    }
    if (block->getHash() == hash) {
      return position;
    }
    current = block->getHash();
  }
  return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
}

Chain::Roe<void> Chain::visit(const Visitor &visitor,
                              const WalkOptions &options) {
  std::lock_guard<std::mutex> lock(mutex_);
  return walkLocked(visitor, options);
}

Chain::Roe<Block> Chain::get(const std::string &hash) {
  if (hash.empty() || hash == genesisHash_) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<Block> found;
  WalkOptions options;
  options.start = hash;
  options.inclusive = true;
  options.limit = 1;
  auto result = walkLocked(
      [&found](const Block &block, uint64_t) {
        found = block;
        return false;
      },
      options);
  if (!result) {
    return result.error();
  }
  if (!found) {
    return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
  }
  return *found;
}

Chain::Roe<Block> Chain::get(uint64_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<Block> found;
  WalkOptions options;
  options.limit = index + 1;
  auto result = walkLocked(
      [&found, index](const Block &block, uint64_t position) {
        if (position == index) {
          found = block;
          return false;
        }
        return true;
      },
      options);
  if (!result) {
    return result.error();
  }
  if (!found) {
    return Error(E_INDEX_NOT_FOUND,
                 "No block at index " + std::to_string(index));
  }
  return *found;
}

Chain::Roe<uint64_t> Chain::getIndex(const std::string &hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!mounted_) {
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }
  }
  return locateLocked(hash);
}

// ----- ordering -----

Chain::Roe<void> Chain::materializeLocked() {
  auto loaded = spStorage_->loadBlocks();
  if (!loaded) {
    log().error << "Failed to load blocks of " << config_.name << ": "
                << loaded.error().message;
    return loaded.error();
  }
  blocks_ = std::move(loaded.value());
  mounted_ = false;
  ordered_ = false;
  rebuildIndexLocked();
  log().debug << "Materialized " << blocks_.size() << " blocks";
  return {};
}

Chain::Roe<void> Chain::orderLocked() {
  if (mounted_) {
    auto result = materializeLocked();
    if (!result) {
      return result;
    }
  }
  if (ordered_) {
    return {};
  }

  ++orderingPassCount_;
  const size_t n = blocks_.size();
  if (n == 0) {
    ordered_ = true;
    return {};
  }

  auto genesis = std::find_if(blocks_.begin(), blocks_.end(),
                              [this](const Block &block) {
                                return block.getPrevious() == genesisHash_;
                              });
  if (genesis == blocks_.end()) {
    log().warning << "No genesis block among " << n << " blocks";
    return Error(E_NO_GENESIS_BLOCK,
                 "No block links to the genesis sentinel");
  }
  std::iter_swap(blocks_.begin(), genesis);

  for (size_t i = 0; i + 1 < n; ++i) {
    const std::string &hash = blocks_[i].getHash();
    if (blocks_[i + 1].getPrevious() == hash) {
      continue;
    }
    bool resolved = false;
    for (size_t j = i + 2; j < n; ++j) {
      if (blocks_[j].getPrevious() == hash) {
        std::swap(blocks_[i + 1], blocks_[j]);
        resolved = true;
        break;
      }
    }
    if (!resolved) {
      log().warning << "No successor for block " << i << " " << hash;
    }
  }

  ordered_ = true;
  rebuildIndexLocked();
  log().debug << "Ordered " << n << " blocks";
  return {};
}

Chain::Roe<void> Chain::order() {
  std::lock_guard<std::mutex> lock(mutex_);
  return orderLocked();
}

// ----- integrity -----

bool Chain::verifyLocked(bool quick) const {
  bool ok = true;
  for (size_t i = 0; i < blocks_.size(); ++i) {
    const Block &block = blocks_[i];
    if (!block.verify(quick)) {
      log().debug << "Block " << i << " fails verification";
      ok = false;
    }
    const std::string &expected =
        i == 0 ? genesisHash_ : blocks_[i - 1].getHash();
    if (block.getPrevious() != expected) {
      log().debug << "Block " << i << " has a broken link";
      ok = false;
    }
  }
  return ok;
}

bool Chain::verify(bool quick) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = orderLocked();
  if (!ordered) {
    log().warning << "Cannot verify " << config_.name << ": "
                  << ordered.error().message;
    return false;
  }
  return verifyLocked(quick);
}

Chain::Roe<std::vector<std::optional<Block>>> Chain::diff(Chain &other) {
  std::unique_lock<std::mutex> selfLock(mutex_, std::defer_lock);
  std::unique_lock<std::mutex> otherLock(other.mutex_, std::defer_lock);
  if (&other == this) {
    selfLock.lock();
  } else {
    std::lock(selfLock, otherLock);
  }

  auto ordered = orderLocked();
  if (!ordered) {
    return ordered.error();
  }
  if (&other != this) {
    auto otherOrdered = other.orderLocked();
    if (!otherOrdered) {
      return otherOrdered.error();
    }
  }

  const std::vector<Block> &mine = blocks_;
  const std::vector<Block> &theirs = other.blocks_;
  std::vector<std::optional<Block>> result;

  if (mine.empty() || theirs.empty()) {
    const std::vector<Block> &nonEmpty = mine.empty() ? theirs : mine;
    result.assign(nonEmpty.begin(), nonEmpty.end());
    return result;
  }

  const bool selfLonger = mine.size() >= theirs.size();
  const std::vector<Block> &longer = selfLonger ? mine : theirs;
  const std::vector<Block> &shorter = selfLonger ? theirs : mine;
  result.reserve(longer.size());

  size_t start = 0;
  while (start < longer.size() &&
         longer[start].getHash() != shorter.front().getHash()) {
    ++start;
  }
  for (size_t k = 0; k < start; ++k) {
    result.emplace_back(longer[k]);
  }

  size_t i = start;
  size_t j = 0;
  while (i < longer.size() && j < shorter.size() &&
         longer[i].getHash() == shorter[j].getHash()) {
    result.emplace_back(std::nullopt);
    ++i;
    ++j;
  }
  for (; i < longer.size(); ++i) {
    result.emplace_back(longer[i]);
  }
  return result;
}

// ----- mutation -----

std::vector<Block> Chain::removeRangeLocked(uint64_t index, uint64_t length) {
  auto first = blocks_.begin() + static_cast<std::ptrdiff_t>(index);
  auto last = first + static_cast<std::ptrdiff_t>(length);
  std::vector<Block> removed(first, last);
  blocks_.erase(first, last);
  rebuildIndexLocked();
  operationLog_.recordDelete(removed, index);
  // Rewrite the shifted tail so stored positions stay dense
  if (index < blocks_.size()) {
    operationLog_.recordAdd(
        std::vector<Block>(blocks_.begin() + static_cast<std::ptrdiff_t>(index),
                           blocks_.end()),
        index);
  }
  log().debug << "Removed " << length << " blocks at " << index;
  return removed;
}

Chain::Roe<uint64_t> Chain::rollback(const std::optional<std::string> &target) {
  uint64_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }
    if (blocks_.empty()) {
      return uint64_t{ 0 };
    }

    uint64_t cut = blocks_.size();
    if (!target) {
      for (uint64_t i = 0; i < blocks_.size(); ++i) {
        const std::string &expected =
            i == 0 ? genesisHash_ : blocks_[i - 1].getHash();
        if (!blocks_[i].verify(false) || blocks_[i].getPrevious() != expected) {
          cut = i;
          break;
        }
      }
      if (cut == blocks_.size()) {
        return Error(E_NOTHING_TO_ROLLBACK,
                     "Chain " + config_.name + " verifies, nothing to roll back");
      }
    } else {
      auto it = indexByHash_.find(*target);
      if (it == indexByHash_.end()) {
        return Error(E_HASH_NOT_FOUND, "Block not found: " + *target);
      }
      cut = it->second + 1;
    }

    removed = blocks_.size() - cut;
    if (removed > 0) {
      removeRangeLocked(cut, removed);
    }
  }

  if (removed > 0) {
    log().info << "Rolled back " << removed << " blocks of " << config_.name;
    touchAutoCommit();
  }
  return removed;
}

Chain::Roe<uint64_t> Chain::add(const Block &block) {
  uint64_t position = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }

    std::string head = headHashLocked();
    if (block.getPrevious() != head) {
      return Error(E_INVALID_PREVIOUS_LINK,
                   "Block " + block.getHash() + " links to " +
                       block.getPrevious() + ", head is " + head);
    }
    if (!block.verify(false)) {
      return Error(E_INVALID_ARGUMENT,
                   "Block " + block.getHash() + " does not verify");
    }

    position = blocks_.size();
    blocks_.push_back(block);
    indexByHash_[block.getHash()] = position;
    operationLog_.recordAdd(block, position);
  }

  log().debug << "Added block " << position << " " << block.getHash();
  touchAutoCommit();
  return position;
}

Chain::Roe<std::vector<Block>> Chain::deleteAt(uint64_t index,
                                               uint64_t length) {
  std::vector<Block> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (length == 0) {
      return Error(E_INVALID_ARGUMENT, "Length must be greater than 0");
    }
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }
    if (index >= blocks_.size() || length > blocks_.size() - index) {
      return Error(E_INDEX_NOT_FOUND,
                   "Range " + std::to_string(index) + "+" +
                       std::to_string(length) + " exceeds height " +
                       std::to_string(blocks_.size()));
    }
    removed = removeRangeLocked(index, length);
  }
  touchAutoCommit();
  return removed;
}

Chain::Roe<std::vector<Block>> Chain::deleteByHash(const std::string &hash,
                                                   uint64_t length) {
  std::vector<Block> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (length == 0) {
      return Error(E_INVALID_ARGUMENT, "Length must be greater than 0");
    }
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }
    auto it = indexByHash_.find(hash);
    if (it == indexByHash_.end()) {
      return Error(E_HASH_NOT_FOUND, "Block not found: " + hash);
    }
    uint64_t index = it->second;
    if (length > blocks_.size() - index) {
      return Error(E_INDEX_NOT_FOUND,
                   "Range " + std::to_string(index) + "+" +
                       std::to_string(length) + " exceeds height " +
                       std::to_string(blocks_.size()));
    }
    removed = removeRangeLocked(index, length);
  }
  touchAutoCommit();
  return removed;
}

// ----- commit -----

Chain::Roe<void> Chain::commit() {
  std::lock_guard<std::mutex> commitLock(commitMutex_);
  return commitLocked();
}

Chain::Roe<void> Chain::commitLocked() {
  OperationLog pending;
  BlockStorage::ChainMeta meta;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto opened = openStorageLocked();
    if (!opened) {
      return opened;
    }
    pending.restoreFront(operationLog_.takeAll());
    meta.name = config_.name;
    meta.height = mounted_ ? mountedHeight_ : blocks_.size();
  }

  const size_t count = pending.size();
  auto replayed = pending.replay(*spStorage_);
  if (!replayed) {
    size_t remaining = pending.size();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      operationLog_.restoreFront(pending.takeAll());
    }
    log().error << "Commit of " << config_.name << " stopped with "
                << remaining << " of " << count
                << " operations pending: " << replayed.error().message;
    return replayed;
  }

  auto saved = spStorage_->saveChainMetadata(meta);
  if (!saved) {
    log().error << "Failed to save metadata of " << config_.name << ": "
                << saved.error().message;
    return saved;
  }

  log().info << "Committed " << count << " operations, " << config_.name
             << " height " << meta.height;
  return {};
}

// ----- lifecycle -----

Chain::Roe<void> Chain::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto opened = openStorageLocked();
  if (!opened) {
    return opened;
  }
  auto meta = spStorage_->loadChainMetadata(config_.name);
  if (!meta) {
    return meta.error();
  }
  auto loaded = spStorage_->loadBlocks();
  if (!loaded) {
    return loaded.error();
  }

  blocks_ = std::move(loaded.value());
  mounted_ = false;
  ordered_ = false;
  operationLog_.clear();
  rebuildIndexLocked();

  auto ordered = orderLocked();
  if (!ordered) {
    return ordered;
  }
  if (meta->height != blocks_.size()) {
    log().warning << "Chain " << config_.name << " metadata height "
                  << meta->height << " but " << blocks_.size()
                  << " blocks stored";
  }
  log().info << "Loaded chain " << config_.name << " with " << blocks_.size()
             << " blocks";
  return {};
}

Chain::Roe<void> Chain::mount() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto opened = openStorageLocked();
  if (!opened) {
    return opened;
  }
  auto meta = spStorage_->loadChainMetadata(config_.name);
  if (!meta) {
    return meta.error();
  }

  blocks_.clear();
  indexByHash_.clear();
  operationLog_.clear();
  mounted_ = true;
  ordered_ = false;
  mountedHeight_ = meta->height;
  log().info << "Mounted chain " << config_.name << " with height "
             << mountedHeight_;
  return {};
}

Chain::Roe<std::unique_ptr<Chain>>
Chain::clone(const std::string &name, std::shared_ptr<BlockStorage> storage) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = orderLocked();
  if (!ordered) {
    return ordered.error();
  }

  Config config = config_;
  config.name = name.empty() ? config_.name + "-CLONE" : name;
  auto upClone = std::make_unique<Chain>(config, blocks_, std::move(storage));
  upClone->ordered_ = true;
  log().debug << "Cloned " << config_.name << " as " << config.name;
  return upClone;
}

bool Chain::equals(Chain &other, bool quick) {
  if (&other == this) {
    return true;
  }
  std::scoped_lock lock(mutex_, other.mutex_);
  if (!orderLocked() || !other.orderLocked()) {
    return false;
  }
  if (blocks_.size() != other.blocks_.size()) {
    return false;
  }
  for (const Block &block : blocks_) {
    auto it = other.indexByHash_.find(block.getHash());
    if (it == other.indexByHash_.end()) {
      return false;
    }
    if (!quick && block.getPayload() != other.blocks_[it->second].getPayload()) {
      return false;
    }
  }
  return true;
}

Chain::Roe<void> Chain::close() {
  if (upAutoCommit_) {
    upAutoCommit_->stop();
  }

  bool hasPending = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hasPending = !operationLog_.empty();
  }
  if (spStorage_ && hasPending) {
    auto committed = commit();
    if (!committed) {
      return committed;
    }
  }

  if (spStorage_) {
    spStorage_->close();
  }
  log().debug << "Closed chain " << config_.name;
  return {};
}

// ----- accessors -----

uint64_t Chain::getHeight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mounted_ ? mountedHeight_ : blocks_.size();
}

std::vector<Block> Chain::getBlocks() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = orderLocked();
  if (!ordered) {
    log().warning << "Returning unordered blocks: " << ordered.error().message;
  }
  return blocks_;
}

Chain::Roe<Block> Chain::getHead() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = orderLocked();
  if (!ordered) {
    return ordered.error();
  }
  if (blocks_.empty()) {
    return Error(E_INDEX_NOT_FOUND, "Chain " + config_.name + " is empty");
  }
  return blocks_.back();
}

Chain::Roe<Block> Chain::createNextBlock(nlohmann::json payload,
                                         const Block::MiningOptions &options) {
  std::string previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ordered = orderLocked();
    if (!ordered) {
      return ordered.error();
    }
    previous = headHashLocked();
  }
  return Block::create(std::move(payload), previous, "", hashFunction_,
                       options);
}

size_t Chain::getPendingOperationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operationLog_.size();
}

std::deque<OperationLog::Operation> Chain::getPendingOperations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operationLog_.getOperations();
}

bool Chain::isOrdered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ordered_;
}

bool Chain::isMounted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mounted_;
}

uint64_t Chain::getOrderingPassCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return orderingPassCount_;
}

nlohmann::json Chain::ltsToJson() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = orderLocked();
  if (!ordered) {
    log().warning << "Serializing unordered chain: "
                  << ordered.error().message;
  }
  nlohmann::json j;
  j["name"] = config_.name;
  j["height"] = mounted_ ? mountedHeight_ : blocks_.size();
  j["blocks"] = nlohmann::json::array();
  for (const Block &block : blocks_) {
    j["blocks"].push_back(block.ltsToJson());
  }
  return j;
}

} // namespace hc
