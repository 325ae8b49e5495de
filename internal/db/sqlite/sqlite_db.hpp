#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace famgraph::db::sqlite {

// Finalizes on scope exit.
using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, multi-statement deletes)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Creates the snapshot tables when missing.
  void EnsureSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace famgraph::db::sqlite
