#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace strands::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->BeginImmediate();
}

SqliteTransaction::~SqliteTransaction() {
  if (!lock_.owns_lock()) {
    return;
  }
  try {
    db_->Rollback();
  } catch (const std::exception& e) {
    STRANDS_LOG_WARN("sqlite rollback failed", {strands::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::runtime_error("sqlite transaction already finished");
  }
  db_->Commit();
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (!lock_.owns_lock()) {
    return;
  }
  db_->Rollback();
  lock_.unlock();
}

} // namespace strands::db::sqlite
