#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/migrations.hpp"
#include "pg_pool.hpp"

namespace strands::db::postgres {

/*
  One pqxx::work on a pooled connection. The connection returns to the
  pool when the transaction is destroyed.

  Also serves as the migration executor so the schema is applied in a
  single transaction at bootstrap.
*/
class PgTransaction final : public db::Transaction, public sql::MigrationExecutor {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *tx_; }

  void ExecuteSQL(const std::string& sql) override { tx_->exec(sql); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_  = false;
};

} // namespace strands::db::postgres
