#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

namespace strands::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

bool IsFilePath(const std::string& path) {
  return !path.empty() && path != ":memory:" && path.rfind("file:", 0) != 0;
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (IsFilePath(path_)) {
    const auto dir = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!dir.empty() && !std::filesystem::create_directories(dir, ec) && ec) {
      throw std::runtime_error("cannot create sqlite directory " + dir.string() + ": " + ec.message());
    }
  }

  const int rc =
      sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "cannot open sqlite database " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    ApplyPragmas();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const char* sql, const char* what) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = std::string(what) + ": " + (err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::ExecuteSQL(const std::string& sql) {
  Exec(sql.c_str(), "sqlite migration failed");
}

void SqliteDB::BeginImmediate() {
  Exec("BEGIN IMMEDIATE;", "sqlite begin failed");
}

void SqliteDB::Commit() {
  Exec("COMMIT;", "sqlite commit failed");
}

void SqliteDB::Rollback() {
  Exec("ROLLBACK;", "sqlite rollback failed");
}

void SqliteDB::ApplyPragmas() {
  Exec("PRAGMA journal_mode=WAL;", "journal_mode");

  // a payment reported as committed must survive power loss
  Exec("PRAGMA synchronous=FULL;", "synchronous");

  // reservation_services rows cascade with their reservation
  Exec("PRAGMA foreign_keys=ON;", "foreign_keys");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace strands::db::sqlite
