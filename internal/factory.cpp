#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/promotion_issuer.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/loyalty_server.hpp"
#include "internal/grpc/promotion_server.hpp"
#include "internal/grpc/settlement_server.hpp"
#include "internal/loyalty/accrual_job.hpp"
#include "internal/loyalty/promotion_expiry.hpp"
#include "internal/notify/inbox_sink.hpp"
#include "internal/notify/log_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/loyalty_service.hpp"
#include "internal/service/promotion_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/settlement_service.hpp"
#if STRANDS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STRANDS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace strands::factory {

using namespace strands;
using strands::runtime::config::NotificationsConfig;
using strands::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<notify::NotificationSink> BuildSink(const RuntimeConfig& config, const std::shared_ptr<db::Repository>& repository) {
  if (config.notifications().sink() == NotificationsConfig::INBOX) {
    return std::make_shared<notify::InboxNotificationSink>(repository);
  }
  return std::make_shared<notify::LogNotificationSink>();
}

std::shared_ptr<loyalty::SweepWorker> BuildSweepWorker(const RuntimeConfig& config, const std::shared_ptr<db::Repository>& repository,
                                                       const std::shared_ptr<notify::NotificationSink>& sink) {
  std::shared_ptr<loyalty::AccrualJob> accrual;
  if (config.loyalty().enabled()) {
    accrual = std::make_shared<loyalty::AccrualJob>(repository, sink, config.notifications().sender_email(),
                                                    config.loyalty().sweep_batch_limit());
  }

  std::shared_ptr<loyalty::PromotionExpirySweep> expiry;
  if (config.promotions().expiry_sweep_enabled()) {
    expiry = std::make_shared<loyalty::PromotionExpirySweep>(repository);
  }

  if (!accrual && !expiry) {
    return nullptr;
  }

  loyalty::SweepWorker::Options options;
  options.accrual_interval = std::chrono::milliseconds(config.loyalty().sweep_interval_ms());
  options.expiry_interval  = std::chrono::milliseconds(config.promotions().expiry_sweep_interval_ms());
  return std::make_shared<loyalty::SweepWorker>(std::move(accrual), std::move(expiry), options);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STRANDS_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    STRANDS_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STRANDS_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      db::postgres::PgTransaction tx(pool);
      db::sql::RunMigrations(tx, db::sql::PostgresSchema());
      tx.Commit();
    }
    STRANDS_LOG_INFO("Using postgres repository", {observability::UIntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STRANDS_LOG_WARN("Using in-memory repository; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and notification delivery
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto sink       = BuildSink(config, repository);

  const auto& sender = config.notifications().sender_email();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto settlement = std::make_shared<core::SettlementEngine>(repository, sink, sender);
  auto promotions = std::make_shared<core::PromotionIssuer>(repository, sender, config.promotions().loyal_customer_min_visits());

  // ------------------------------------------------------------------
  // Background sweeps
  // ------------------------------------------------------------------
  auto sweep_worker = BuildSweepWorker(config, repository, sink);
  if (sweep_worker) {
    sweep_worker->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.settlement = settlement;
  ctx.promotions = promotions;
  ctx.repository = repository;

  auto settlement_service = std::make_shared<service::SettlementService>(ctx);
  auto promotion_service  = std::make_shared<service::PromotionService>(ctx);
  auto loyalty_service    = std::make_shared<service::LoyaltyService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SettlementServer>(settlement_service));
  app.grpc_services.push_back(std::make_unique<grpc::PromotionServer>(promotion_service));
  app.grpc_services.push_back(std::make_unique<grpc::LoyaltyServer>(loyalty_service));

  app.repository   = repository;
  app.sweep_worker = sweep_worker;

  return app;
}

} // namespace strands::factory
