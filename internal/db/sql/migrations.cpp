#include "migrations.hpp"

namespace strands::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS merchants (merchant_id INTEGER PRIMARY KEY, owner_user_id INTEGER NOT NULL, name TEXT NOT NULL, "
      "sender_email TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS payment_instruments (instrument_id INTEGER PRIMARY KEY, user_id INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS billing_addresses (billing_address_id INTEGER PRIMARY KEY, user_id INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reservations (reservation_id INTEGER PRIMARY KEY AUTOINCREMENT, customer_id INTEGER NOT NULL, "
      "merchant_id INTEGER NOT NULL, scheduled_start_ms INTEGER NOT NULL, scheduled_end_ms INTEGER NOT NULL, status TEXT NOT NULL "
      "CHECK (status IN ('PENDING','SCHEDULED','COMPLETED','CANCELED')), loyalty_seen INTEGER NOT NULL DEFAULT 0 "
      "CHECK (loyalty_seen IN (0,1,2)), created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS reservations_accrual_idx ON reservations(status, loyalty_seen, scheduled_end_ms);",
      "CREATE TABLE IF NOT EXISTS reservation_services (reservation_id INTEGER NOT NULL REFERENCES reservations(reservation_id) "
      "ON DELETE CASCADE, service_id INTEGER NOT NULL, staff_id INTEGER, price_cents INTEGER NOT NULL, duration_minutes INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payments (payment_id INTEGER PRIMARY KEY AUTOINCREMENT, customer_id INTEGER NOT NULL, reservation_id "
      "INTEGER, order_id INTEGER, instrument_id INTEGER NOT NULL, billing_address_id INTEGER NOT NULL, reward_id INTEGER, promotion_id "
      "INTEGER, amount_cents INTEGER NOT NULL CHECK (amount_cents > 0), status TEXT NOT NULL DEFAULT 'SUCCEEDED', created_at_ms INTEGER "
      "NOT NULL, CHECK ((reservation_id IS NULL) <> (order_id IS NULL)), CHECK (reward_id IS NULL OR promotion_id IS NULL));",
      "CREATE TABLE IF NOT EXISTS rewards (reward_id INTEGER PRIMARY KEY AUTOINCREMENT, customer_id INTEGER NOT NULL, merchant_id INTEGER "
      "NOT NULL, discount_pct INTEGER NOT NULL, note TEXT NOT NULL DEFAULT '', active INTEGER NOT NULL DEFAULT 1, redeemed_at_ms INTEGER, "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS promotions (promotion_id INTEGER PRIMARY KEY AUTOINCREMENT, customer_id INTEGER NOT NULL, merchant_id "
      "INTEGER NOT NULL, code TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', discount_bps INTEGER NOT NULL CHECK (discount_bps > 0 "
      "AND discount_bps <= 10000), status TEXT NOT NULL CHECK (status IN ('ISSUED','REDEEMED','EXPIRED')), issued_at_ms INTEGER NOT NULL, "
      "expires_at_ms INTEGER, redeemed_at_ms INTEGER, redeemed_reservation_id INTEGER, redeemed_payment_id INTEGER, "
      "UNIQUE (customer_id, merchant_id, code));",
      "CREATE INDEX IF NOT EXISTS promotions_merchant_code_idx ON promotions(merchant_id, code);",
      "CREATE TABLE IF NOT EXISTS loyalty_memberships (customer_id INTEGER NOT NULL, merchant_id INTEGER NOT NULL, visits_count INTEGER "
      "NOT NULL DEFAULT 0, total_visits_count INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (customer_id, merchant_id));",
      "CREATE TABLE IF NOT EXISTS loyalty_programs (merchant_id INTEGER PRIMARY KEY, target_visits INTEGER NOT NULL CHECK (target_visits "
      "> 0), discount_pct INTEGER NOT NULL, note TEXT NOT NULL DEFAULT '', active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS notifications (notification_id INTEGER PRIMARY KEY AUTOINCREMENT, recipient_id INTEGER NOT NULL, "
      "merchant_id INTEGER NOT NULL, sender_email TEXT NOT NULL DEFAULT '', category TEXT NOT NULL, message TEXT NOT NULL, reservation_id "
      "INTEGER, payment_id INTEGER, promotion_id INTEGER, promo_code TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS merchants (merchant_id BIGINT PRIMARY KEY, owner_user_id BIGINT NOT NULL, name TEXT NOT NULL, "
      "sender_email TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS payment_instruments (instrument_id BIGINT PRIMARY KEY, user_id BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS billing_addresses (billing_address_id BIGINT PRIMARY KEY, user_id BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS reservations (reservation_id BIGSERIAL PRIMARY KEY, customer_id BIGINT NOT NULL, merchant_id BIGINT "
      "NOT NULL, scheduled_start_ms BIGINT NOT NULL, scheduled_end_ms BIGINT NOT NULL, status TEXT NOT NULL CHECK (status IN "
      "('PENDING','SCHEDULED','COMPLETED','CANCELED')), loyalty_seen SMALLINT NOT NULL DEFAULT 0 CHECK (loyalty_seen IN (0,1,2)), "
      "created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS reservations_accrual_idx ON reservations(status, loyalty_seen, scheduled_end_ms);",
      "CREATE TABLE IF NOT EXISTS reservation_services (reservation_id BIGINT NOT NULL REFERENCES reservations(reservation_id) ON DELETE "
      "CASCADE, service_id BIGINT NOT NULL, staff_id BIGINT, price_cents BIGINT NOT NULL, duration_minutes INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payments (payment_id BIGSERIAL PRIMARY KEY, customer_id BIGINT NOT NULL, reservation_id BIGINT, order_id "
      "BIGINT, instrument_id BIGINT NOT NULL, billing_address_id BIGINT NOT NULL, reward_id BIGINT, promotion_id BIGINT, amount_cents "
      "BIGINT NOT NULL CHECK (amount_cents > 0), status TEXT NOT NULL DEFAULT 'SUCCEEDED', created_at_ms BIGINT NOT NULL, CHECK "
      "((reservation_id IS NULL) <> (order_id IS NULL)), CHECK (reward_id IS NULL OR promotion_id IS NULL));",
      "CREATE TABLE IF NOT EXISTS rewards (reward_id BIGSERIAL PRIMARY KEY, customer_id BIGINT NOT NULL, merchant_id BIGINT NOT NULL, "
      "discount_pct INTEGER NOT NULL, note TEXT NOT NULL DEFAULT '', active BOOLEAN NOT NULL DEFAULT TRUE, redeemed_at_ms BIGINT, "
      "created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS promotions (promotion_id BIGSERIAL PRIMARY KEY, customer_id BIGINT NOT NULL, merchant_id BIGINT NOT "
      "NULL, code TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', discount_bps INTEGER NOT NULL CHECK (discount_bps > 0 AND "
      "discount_bps <= 10000), status TEXT NOT NULL CHECK (status IN ('ISSUED','REDEEMED','EXPIRED')), issued_at_ms BIGINT NOT NULL, "
      "expires_at_ms BIGINT, redeemed_at_ms BIGINT, redeemed_reservation_id BIGINT, redeemed_payment_id BIGINT, UNIQUE (customer_id, "
      "merchant_id, code));",
      "CREATE INDEX IF NOT EXISTS promotions_merchant_code_idx ON promotions(merchant_id, code);",
      "CREATE TABLE IF NOT EXISTS loyalty_memberships (customer_id BIGINT NOT NULL, merchant_id BIGINT NOT NULL, visits_count INTEGER NOT "
      "NULL DEFAULT 0, total_visits_count INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (customer_id, merchant_id));",
      "CREATE TABLE IF NOT EXISTS loyalty_programs (merchant_id BIGINT PRIMARY KEY, target_visits INTEGER NOT NULL CHECK (target_visits "
      "> 0), discount_pct INTEGER NOT NULL, note TEXT NOT NULL DEFAULT '', active BOOLEAN NOT NULL DEFAULT TRUE);",
      "CREATE TABLE IF NOT EXISTS notifications (notification_id BIGSERIAL PRIMARY KEY, recipient_id BIGINT NOT NULL, merchant_id BIGINT "
      "NOT NULL, sender_email TEXT NOT NULL DEFAULT '', category TEXT NOT NULL, message TEXT NOT NULL, reservation_id BIGINT, payment_id "
      "BIGINT, promotion_id BIGINT, promo_code TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace strands::db::sql
