#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace famgraph::db::sqlite {

/*
  BEGIN IMMEDIATE on construction, so the write lock is held before the first
  DELETE of a snapshot replacement and the swap cannot hit SQLITE_BUSY midway.
  Rolls back on destruction unless committed.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  // set by Commit and Rollback; the destructor only acts while false
  bool finished_  = false;
};

}
