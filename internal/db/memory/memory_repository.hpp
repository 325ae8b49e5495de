#pragma once

#include <cstdint>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace famgraph::db::memory {

class MemoryTransaction;

/*
  Keeps the last committed snapshot in process memory. Backs the daemon when
  no database is configured, so nothing survives a restart.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result ReplaceSnapshot(Transaction&, const model::GraphSnapshot&) override;
  Result LoadSnapshot(Transaction&, model::GraphSnapshot& out) override;

private:
  friend class MemoryTransaction;

  std::mutex           mutex_;
  model::GraphSnapshot stored_;
  // bumped by every commit; a transaction begun before it cannot commit
  std::uint64_t        generation_ = 0;
};

}
