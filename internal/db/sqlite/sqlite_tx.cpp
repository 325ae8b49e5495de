#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace famgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    FAMGRAPH_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::logic_error("sqlite transaction already finished");
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace famgraph::db::sqlite
