#pragma once

namespace famgraph::db {

/*
  Unit of work around one snapshot read or replacement.

  Every backend guarantees:
  - a replacement stays invisible to other transactions until Commit()
  - Rollback() or destruction without Commit() leaves the stored snapshot as it was
  - Commit() after Rollback() is a logic error

  SQLite opens with BEGIN IMMEDIATE; the memory backend works on a private copy
  and refuses to commit over a concurrent commit.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace famgraph::db
