#pragma once

#include <memory>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/relationship.hpp"

namespace famgraph::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - ReplaceSnapshot swaps the whole stored graph; a reader never sees a mix
    of two snapshots once the transaction commits

  The in-memory FamilyGraph is the source of truth while the process runs;
  the repository only holds what it was last given.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Snapshot
  // ---------------------------------------------------------------------

  virtual Result ReplaceSnapshot(Transaction&, const model::GraphSnapshot&) = 0;

  // Empty snapshot when nothing was stored yet.
  virtual Result LoadSnapshot(Transaction&, model::GraphSnapshot& out) = 0;
};

} // namespace famgraph::db
