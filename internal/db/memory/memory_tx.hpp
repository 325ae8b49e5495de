#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace famgraph::db::memory {

// Private copy of the stored snapshot, published on Commit.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const model::GraphSnapshot& View() const {
    return working_;
  }

  void Replace(const model::GraphSnapshot& snapshot) {
    working_ = snapshot;
    dirty_   = true;
  }

 private:
  MemoryRepository&    repo_;
  model::GraphSnapshot working_;
  std::uint64_t        base_generation_ = 0;
  bool                 dirty_           = false;
  bool                 committed_       = false;
  bool                 rolled_back_     = false;
};

} // namespace famgraph::db::memory
