#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace famgraph::db::sqlite {

/*
  Snapshot storage in four tables: person, person_attribute, relationship,
  relationship_attribute. ReplaceSnapshot rewrites all of them inside the
  caller's transaction.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result ReplaceSnapshot(Transaction&, const model::GraphSnapshot&) override;
  Result LoadSnapshot(Transaction&, model::GraphSnapshot& out) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
