#ifndef HASHCHAIN_OPERATION_LOG_H
#define HASHCHAIN_OPERATION_LOG_H

#include "Block.h"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace hc {

class BlockStorage;

/**
 * Ordered record of the add/delete operations applied to a chain in memory
 * since its last commit.
 */
class OperationLog {
public:
  using Error = ChainError;
  template <typename T> using Roe = ResultOrError<T, Error>;

  enum class Kind : uint8_t { ADD = 0, DELETE = 1 };

  struct Operation {
    Kind kind{ Kind::ADD };
    std::vector<Block> blocks;
    // Chain position of blocks.front()
    uint64_t position{ 0 };
  };

  void recordAdd(const Block &block, uint64_t position);
  // Consecutive blocks written from position on, e.g. a tail that shifted
  void recordAdd(std::vector<Block> blocks, uint64_t position);
  void recordDelete(std::vector<Block> blocks, uint64_t position);

  bool empty() const { return operations_.empty(); }
  size_t size() const { return operations_.size(); }
  const std::deque<Operation> &getOperations() const { return operations_; }

  void clear() { operations_.clear(); }

  /**
   * Move every operation out, leaving the log empty
   */
  std::deque<Operation> takeAll();

  /**
   * Put operations back ahead of anything recorded since they were taken
   */
  void restoreFront(std::deque<Operation> operations);

  /**
   * Apply the operations to the storage in recorded order. Each applied
   * operation is removed; on failure the failing operation, minus the blocks
   * it already applied, stays at the front together with every later one.
   * @return Success, or the storage error that stopped the replay
   */
  Roe<void> replay(BlockStorage &storage);

  static std::string toString(Kind kind);

private:
  std::deque<Operation> operations_;
};

} // namespace hc

#endif // HASHCHAIN_OPERATION_LOG_H
