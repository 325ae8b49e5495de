#include "memory_tx.hpp"

#include <stdexcept>

namespace famgraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_         = repo_.stored_;
  base_generation_ = repo_.generation_;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) throw std::logic_error("transaction already rolled back");
  if (committed_) return;
  committed_ = true;
  // read-only transactions publish nothing and never conflict
  if (!dirty_) return;

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.generation_ != base_generation_) {
    committed_ = false;
    throw std::runtime_error("transaction conflict: snapshot replaced by a concurrent transaction");
  }
  repo_.stored_ = std::move(working_);
  ++repo_.generation_;
}

// Dropping the private copy is all a rollback needs; the destructor does the same.
void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace famgraph::db::memory
