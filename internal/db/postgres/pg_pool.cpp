#include "pg_pool.hpp"

#include <stdexcept>

namespace strands::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool available = returned_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || open_ < max_connections_; });
  if (!available) {
    throw std::runtime_error("postgres pool exhausted: " + std::to_string(max_connections_) + " connections busy");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Checkout(std::move(conn));
  }

  // open outside the lock; the slot is reserved first
  ++open_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard guard(mutex_);
      --open_;
    }
    returned_.notify_one();
    throw;
  }
  return Checkout(std::move(conn));
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_reservation",
               "SELECT reservation_id,customer_id,merchant_id,scheduled_start_ms,scheduled_end_ms,status,loyalty_seen,created_at_ms "
               "FROM reservations WHERE reservation_id=$1");

  conn.prepare("transition_reservation", "UPDATE reservations SET status=$3 WHERE reservation_id=$1 AND status=$2");

  conn.prepare("redeem_reward",
               "UPDATE rewards SET active=FALSE, redeemed_at_ms=$4 "
               "WHERE reward_id=$1 AND customer_id=$2 AND merchant_id=$3 AND active AND redeemed_at_ms IS NULL");

  conn.prepare("redeem_promotion",
               "UPDATE promotions SET status='REDEEMED', redeemed_at_ms=$3, redeemed_reservation_id=$4, redeemed_payment_id=$5 "
               "WHERE promotion_id=$1 AND customer_id=$2 AND status='ISSUED'");

  conn.prepare("insert_payment",
               "INSERT INTO payments(customer_id,reservation_id,order_id,instrument_id,billing_address_id,reward_id,promotion_id,"
               "amount_cents,status,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING payment_id");

  conn.prepare("lock_membership",
               "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships "
               "WHERE customer_id=$1 AND merchant_id=$2 FOR UPDATE");
}

std::shared_ptr<pqxx::connection> PgPool::Checkout(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* c) {
    if (auto self = pool.lock()) {
      self->Return(c);
      return;
    }
    delete c;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard guard(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      // broken connections are dropped and their slot freed
      --open_;
    }
  }
  returned_.notify_one();
}

} // namespace strands::db::postgres
