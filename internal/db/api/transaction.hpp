#pragma once

namespace strands::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Conflicting writes block until the holder finishes
    (row locks on Postgres, the write lock on SQLite and memory)

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: working copy swapped in on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace strands::db
