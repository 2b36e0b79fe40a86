#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace strands::db::sqlite {

/*
  Owner of the single sqlite3* connection behind the settlement store.

  Opening creates the database file (and its directory) if missing and
  applies the durability pragmas. Every SqliteTransaction shares this
  connection, so transactions queue on TransactionMutex().
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void ExecuteSQL(const std::string& sql) override;

  // Write lock taken at BEGIN so a settlement never fails half way on SQLITE_BUSY.
  void BeginImmediate();
  void Commit();
  void Rollback();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Exec(const char* sql, const char* what);
  void ApplyPragmas();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace strands::db::sqlite
