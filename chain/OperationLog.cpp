#include "OperationLog.h"
#include "BlockStorage.h"

namespace hc {

void OperationLog::recordAdd(const Block &block, uint64_t position) {
  Operation op;
  op.kind = Kind::ADD;
  op.blocks.push_back(block);
  op.position = position;
  operations_.push_back(std::move(op));
}

void OperationLog::recordAdd(std::vector<Block> blocks, uint64_t position) {
  if (blocks.empty()) {
    return;
  }
  Operation op;
  op.kind = Kind::ADD;
  op.blocks = std::move(blocks);
  op.position = position;
  operations_.push_back(std::move(op));
}

void OperationLog::recordDelete(std::vector<Block> blocks, uint64_t position) {
  if (blocks.empty()) {
    return;
  }
  Operation op;
  op.kind = Kind::DELETE;
  op.blocks = std::move(blocks);
  op.position = position;
  operations_.push_back(std::move(op));
}

std::deque<OperationLog::Operation> OperationLog::takeAll() {
  std::deque<Operation> taken;
  taken.swap(operations_);
  return taken;
}

void OperationLog::restoreFront(std::deque<Operation> operations) {
  operations_.insert(operations_.begin(),
                     std::make_move_iterator(operations.begin()),
                     std::make_move_iterator(operations.end()));
}

OperationLog::Roe<void> OperationLog::replay(BlockStorage &storage) {
  while (!operations_.empty()) {
    Operation &op = operations_.front();

    while (!op.blocks.empty()) {
      const Block &block = op.blocks.front();
      if (op.kind == Kind::ADD) {
        auto result = storage.persistBlock(block, op.position);
        if (!result) {
          return Error(result.error().code,
                       "Failed to persist block " + block.getHash() + ": " +
                           result.error().message);
        }
      } else {
        auto result = storage.deleteBlock(block.getHash());
        if (!result) {
          return Error(result.error().code,
                       "Failed to delete block " + block.getHash() + ": " +
                           result.error().message);
        }
      }
      op.blocks.erase(op.blocks.begin());
      op.position++;
    }

    operations_.pop_front();
  }
  return {};
}

std::string OperationLog::toString(Kind kind) {
  switch (kind) {
  case Kind::ADD:
    return "ADD";
  case Kind::DELETE:
    return "DELETE";
  default:
    return "UNKNOWN";
  }
}

} // namespace hc
