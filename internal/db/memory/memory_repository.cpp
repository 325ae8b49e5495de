#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace famgraph::db::memory {

namespace {

MemoryTransaction& AsMemory(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryRepository::ReplaceSnapshot(Transaction& tx, const model::GraphSnapshot& snapshot) {
  AsMemory(tx).Replace(snapshot);
  return Result::Ok();
}

// Reads see the transaction's own replacement, if any.
Result MemoryRepository::LoadSnapshot(Transaction& tx, model::GraphSnapshot& out) {
  out = AsMemory(tx).View();
  return Result::Ok();
}

} // namespace famgraph::db::memory
