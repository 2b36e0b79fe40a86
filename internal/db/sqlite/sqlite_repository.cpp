#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace strands::db::sqlite {

using strands::db::ErrorCode;
using strands::db::Result;
using strands::model::LoyaltySeen;
using strands::model::PromotionStatus;
using strands::model::ReservationStatus;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return StmtPtr(nullptr, sqlite3_finalize);
  }
  return StmtPtr(st, sqlite3_finalize);
}

// Reads surface backend failures as exceptions, never as "no row".
StmtPtr PrepareRead(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v.has_value()) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

ReservationStatus ColReservationStatus(sqlite3_stmt* st, int col) {
  auto text   = ColText(st, col);
  auto status = strands::model::ParseReservationStatus(text);
  if (!status) throw std::runtime_error("corrupt reservation status: " + text);
  return *status;
}

PromotionStatus ColPromotionStatus(sqlite3_stmt* st, int col) {
  auto text   = ColText(st, col);
  auto status = strands::model::ParsePromotionStatus(text);
  if (!status) throw std::runtime_error("corrupt promotion status: " + text);
  return *status;
}

std::string StatusText(ReservationStatus s) {
  return std::string(strands::model::ToString(s));
}

std::string StatusText(PromotionStatus s) {
  return std::string(strands::model::ToString(s));
}

// ------------------------------------------------------------------
// Row readers
// ------------------------------------------------------------------

constexpr const char* kReservationColumns =
    "reservation_id,customer_id,merchant_id,scheduled_start_ms,scheduled_end_ms,status,loyalty_seen,created_at_ms";

model::ReservationRecord ReadReservation(sqlite3_stmt* st) {
  model::ReservationRecord r;
  r.id                 = ColU64(st, 0);
  r.customer_id        = ColU64(st, 1);
  r.merchant_id        = ColU64(st, 2);
  r.scheduled_start_ms = ColU64(st, 3);
  r.scheduled_end_ms   = ColU64(st, 4);
  r.status             = ColReservationStatus(st, 5);
  r.loyalty_seen       = static_cast<LoyaltySeen>(sqlite3_column_int(st, 6));
  r.created_at_ms      = ColU64(st, 7);
  return r;
}

constexpr const char* kPaymentColumns =
    "payment_id,customer_id,reservation_id,order_id,instrument_id,billing_address_id,reward_id,promotion_id,amount_cents,"
    "created_at_ms";

model::PaymentRecord ReadPayment(sqlite3_stmt* st) {
  model::PaymentRecord r;
  r.id                 = ColU64(st, 0);
  r.customer_id        = ColU64(st, 1);
  r.reservation_id     = ColOptU64(st, 2);
  r.order_id           = ColOptU64(st, 3);
  r.instrument_id      = ColU64(st, 4);
  r.billing_address_id = ColU64(st, 5);
  r.reward_id          = ColOptU64(st, 6);
  r.promotion_id       = ColOptU64(st, 7);
  r.amount_cents       = ColI64(st, 8);
  r.created_at_ms      = ColU64(st, 9);
  return r;
}

constexpr const char* kRewardColumns = "reward_id,customer_id,merchant_id,discount_pct,note,active,redeemed_at_ms,created_at_ms";

model::RewardRecord ReadReward(sqlite3_stmt* st) {
  model::RewardRecord r;
  r.id             = ColU64(st, 0);
  r.customer_id    = ColU64(st, 1);
  r.merchant_id    = ColU64(st, 2);
  r.discount_pct   = sqlite3_column_int(st, 3);
  r.note           = ColText(st, 4);
  r.active         = sqlite3_column_int(st, 5) != 0;
  r.redeemed_at_ms = ColOptU64(st, 6);
  r.created_at_ms  = ColU64(st, 7);
  return r;
}

constexpr const char* kPromotionColumns =
    "promotion_id,customer_id,merchant_id,code,description,discount_bps,status,issued_at_ms,expires_at_ms,redeemed_at_ms,"
    "redeemed_reservation_id,redeemed_payment_id";

model::PromotionRecord ReadPromotion(sqlite3_stmt* st) {
  model::PromotionRecord r;
  r.id                      = ColU64(st, 0);
  r.customer_id             = ColU64(st, 1);
  r.merchant_id             = ColU64(st, 2);
  r.code                    = ColText(st, 3);
  r.description             = ColText(st, 4);
  r.discount_bps            = sqlite3_column_int(st, 5);
  r.status                  = ColPromotionStatus(st, 6);
  r.issued_at_ms            = ColU64(st, 7);
  r.expires_at_ms           = ColOptU64(st, 8);
  r.redeemed_at_ms          = ColOptU64(st, 9);
  r.redeemed_reservation_id = ColOptU64(st, 10);
  r.redeemed_payment_id     = ColOptU64(st, 11);
  return r;
}

model::MembershipRecord ReadMembership(sqlite3_stmt* st) {
  model::MembershipRecord r;
  r.customer_id        = ColU64(st, 0);
  r.merchant_id        = ColU64(st, 1);
  r.visits_count       = static_cast<uint32_t>(sqlite3_column_int64(st, 2));
  r.total_visits_count = static_cast<uint32_t>(sqlite3_column_int64(st, 3));
  return r;
}

std::string WithColumns(const char* columns, const char* tail) {
  return std::string("SELECT ") + columns + " " + tail;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

CasResult SqliteRepository::StepCas(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return CasResult::Failed(Translate(db, rc));
  return sqlite3_changes(db) == 1 ? CasResult::Swapped() : CasResult::Missed();
}

// ------------------------------------------------------------------
// Merchants and accounts
// ------------------------------------------------------------------

Result SqliteRepository::InsertMerchant(Transaction& t, const model::MerchantRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO merchants(merchant_id,owner_user_id,name,sender_email) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.owner_user_id);
  BindText(st.get(), 3, r.name);
  BindText(st.get(), 4, r.sender_email);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MerchantRecord> SqliteRepository::GetMerchant(Transaction& t, uint64_t merchant_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT merchant_id,owner_user_id,name,sender_email FROM merchants WHERE merchant_id=?;");
  BindU64(st.get(), 1, merchant_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::MerchantRecord r;
  r.id            = ColU64(st.get(), 0);
  r.owner_user_id = ColU64(st.get(), 1);
  r.name          = ColText(st.get(), 2);
  r.sender_email  = ColText(st.get(), 3);
  return r;
}

Result SqliteRepository::InsertInstrument(Transaction& t, const model::InstrumentRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO payment_instruments(instrument_id,user_id) VALUES(?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.user_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertBillingAddress(Transaction& t, const model::BillingAddressRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO billing_addresses(billing_address_id,user_id) VALUES(?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.user_id);
  return Translate(db, sqlite3_step(st.get()));
}

bool SqliteRepository::InstrumentBelongsTo(Transaction& t, uint64_t instrument_id, uint64_t user_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT 1 FROM payment_instruments WHERE instrument_id=? AND user_id=?;");
  BindU64(st.get(), 1, instrument_id);
  BindU64(st.get(), 2, user_id);
  return StepRow(db, st.get());
}

bool SqliteRepository::BillingAddressBelongsTo(Transaction& t, uint64_t address_id, uint64_t user_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT 1 FROM billing_addresses WHERE billing_address_id=? AND user_id=?;");
  BindU64(st.get(), 1, address_id);
  BindU64(st.get(), 2, user_id);
  return StepRow(db, st.get());
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result SqliteRepository::InsertReservation(Transaction& t, model::ReservationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO reservations(reservation_id,customer_id,merchant_id,scheduled_start_ms,scheduled_end_ms,status,"
                     "loyalty_seen,created_at_ms) VALUES(NULLIF(?,0),?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.customer_id);
  BindU64(st.get(), 3, r.merchant_id);
  BindU64(st.get(), 4, r.scheduled_start_ms);
  BindU64(st.get(), 5, r.scheduled_end_ms);
  BindText(st.get(), 6, StatusText(r.status));
  sqlite3_bind_int(st.get(), 7, static_cast<int>(r.loyalty_seen));
  BindU64(st.get(), 8, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::InsertReservationService(Transaction& t, const model::ReservationServiceRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO reservation_services(reservation_id,service_id,staff_id,price_cents,duration_minutes) "
                     "VALUES(?,?,NULLIF(?,0),?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.reservation_id);
  BindU64(st.get(), 2, r.service_id);
  BindU64(st.get(), 3, r.staff_id);
  BindI64(st.get(), 4, r.price_cents);
  sqlite3_bind_int(st.get(), 5, static_cast<int>(r.duration_minutes));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ReservationRecord> SqliteRepository::GetReservation(Transaction& t, uint64_t id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kReservationColumns, "FROM reservations WHERE reservation_id=?;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadReservation(st.get());
}

std::vector<model::ReservationServiceRecord> SqliteRepository::ListReservationServices(Transaction& t, uint64_t reservation_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db,
                         "SELECT reservation_id,service_id,COALESCE(staff_id,0),price_cents,duration_minutes "
                         "FROM reservation_services WHERE reservation_id=? ORDER BY rowid;");
  BindU64(st.get(), 1, reservation_id);

  std::vector<model::ReservationServiceRecord> out;
  while (StepRow(db, st.get())) {
    model::ReservationServiceRecord r;
    r.reservation_id   = ColU64(st.get(), 0);
    r.service_id       = ColU64(st.get(), 1);
    r.staff_id         = ColU64(st.get(), 2);
    r.price_cents      = ColI64(st.get(), 3);
    r.duration_minutes = static_cast<uint32_t>(sqlite3_column_int(st.get(), 4));
    out.push_back(r);
  }
  return out;
}

uint64_t SqliteRepository::CountReservations(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT COUNT(*) FROM reservations WHERE customer_id=? AND merchant_id=?;");
  BindU64(st.get(), 1, customer_id);
  BindU64(st.get(), 2, merchant_id);
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

CasResult SqliteRepository::TransitionReservation(Transaction& t, uint64_t id, ReservationStatus from, ReservationStatus to) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE reservations SET status=? WHERE reservation_id=? AND status=?;");
  if (!st) return CasResult::Failed(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)));

  BindText(st.get(), 1, StatusText(to));
  BindU64(st.get(), 2, id);
  BindText(st.get(), 3, StatusText(from));
  return StepCas(db, st.get());
}

CasResult SqliteRepository::DeletePendingReservation(Transaction& t, uint64_t id, uint64_t customer_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM reservations WHERE reservation_id=? AND customer_id=? AND status='PENDING';");
  if (!st) return CasResult::Failed(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)));

  BindU64(st.get(), 1, id);
  BindU64(st.get(), 2, customer_id);
  return StepCas(db, st.get());
}

// ------------------------------------------------------------------
// Loyalty bookkeeping
// ------------------------------------------------------------------

std::vector<model::ReservationRecord> SqliteRepository::ListAccrualCandidates(Transaction& t, uint64_t now_ms, std::size_t limit) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kReservationColumns,
                          "FROM reservations WHERE status='COMPLETED' AND loyalty_seen=0 AND scheduled_end_ms<? "
                          "ORDER BY reservation_id LIMIT ?;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, now_ms);
  sqlite3_bind_int64(st.get(), 2, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  std::vector<model::ReservationRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadReservation(st.get()));
  }
  return out;
}

CasResult SqliteRepository::MarkLoyaltySeen(Transaction& t, uint64_t reservation_id, LoyaltySeen from, LoyaltySeen to) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE reservations SET loyalty_seen=? WHERE reservation_id=? AND loyalty_seen=?;");
  if (!st) return CasResult::Failed(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)));

  sqlite3_bind_int(st.get(), 1, static_cast<int>(to));
  BindU64(st.get(), 2, reservation_id);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(from));
  return StepCas(db, st.get());
}

Result SqliteRepository::MarkCanceledLoyaltySeen(Transaction& t, uint64_t& affected) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE reservations SET loyalty_seen=2 WHERE status='CANCELED' AND loyalty_seen=0;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  affected = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO payments(customer_id,reservation_id,order_id,instrument_id,billing_address_id,reward_id,promotion_id,"
                     "amount_cents,status,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.customer_id);
  BindOptU64(st.get(), 2, r.reservation_id);
  BindOptU64(st.get(), 3, r.order_id);
  BindU64(st.get(), 4, r.instrument_id);
  BindU64(st.get(), 5, r.billing_address_id);
  BindOptU64(st.get(), 6, r.reward_id);
  BindOptU64(st.get(), 7, r.promotion_id);
  BindI64(st.get(), 8, r.amount_cents);
  BindText(st.get(), 9, std::string(strands::model::ToString(r.status)));
  BindU64(st.get(), 10, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) != 1) return Result::Err(ErrorCode::InternalError, "payment insert affected no rows");

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::PaymentRecord> SqliteRepository::GetPayment(Transaction& t, uint64_t id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kPaymentColumns, "FROM payments WHERE payment_id=?;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadPayment(st.get());
}

std::vector<model::PaymentRecord> SqliteRepository::ListPaymentsForReservation(Transaction& t, uint64_t reservation_id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kPaymentColumns, "FROM payments WHERE reservation_id=? ORDER BY payment_id;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, reservation_id);

  std::vector<model::PaymentRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadPayment(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Rewards
// ------------------------------------------------------------------

Result SqliteRepository::InsertReward(Transaction& t, model::RewardRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO rewards(customer_id,merchant_id,discount_pct,note,active,redeemed_at_ms,created_at_ms) "
                     "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.customer_id);
  BindU64(st.get(), 2, r.merchant_id);
  sqlite3_bind_int(st.get(), 3, r.discount_pct);
  BindText(st.get(), 4, r.note);
  sqlite3_bind_int(st.get(), 5, r.active ? 1 : 0);
  BindOptU64(st.get(), 6, r.redeemed_at_ms);
  BindU64(st.get(), 7, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::RewardRecord> SqliteRepository::GetReward(Transaction& t, uint64_t id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kRewardColumns, "FROM rewards WHERE reward_id=?;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadReward(st.get());
}

std::optional<model::RewardRecord> SqliteRepository::FindRedeemableReward(Transaction& t, uint64_t reward_id, uint64_t customer_id,
                                                                          uint64_t merchant_id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kRewardColumns,
                          "FROM rewards WHERE reward_id=? AND customer_id=? AND merchant_id=? AND active=1 AND redeemed_at_ms IS NULL;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, reward_id);
  BindU64(st.get(), 2, customer_id);
  BindU64(st.get(), 3, merchant_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadReward(st.get());
}

CasResult SqliteRepository::RedeemReward(Transaction& t, uint64_t reward_id, uint64_t customer_id, uint64_t merchant_id,
                                         uint64_t redeemed_at_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE rewards SET active=0, redeemed_at_ms=? WHERE reward_id=? AND customer_id=? AND merchant_id=? "
                     "AND active=1 AND redeemed_at_ms IS NULL;");
  if (!st) return CasResult::Failed(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)));

  BindU64(st.get(), 1, redeemed_at_ms);
  BindU64(st.get(), 2, reward_id);
  BindU64(st.get(), 3, customer_id);
  BindU64(st.get(), 4, merchant_id);
  return StepCas(db, st.get());
}

std::vector<model::RewardRecord> SqliteRepository::ListRewards(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kRewardColumns, "FROM rewards WHERE customer_id=? AND merchant_id=? ORDER BY reward_id;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, customer_id);
  BindU64(st.get(), 2, merchant_id);

  std::vector<model::RewardRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadReward(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Promotions
// ------------------------------------------------------------------

Result SqliteRepository::InsertPromotion(Transaction& t, model::PromotionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO promotions(customer_id,merchant_id,code,description,discount_bps,status,issued_at_ms,expires_at_ms) "
                     "VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.customer_id);
  BindU64(st.get(), 2, r.merchant_id);
  BindText(st.get(), 3, r.code);
  BindText(st.get(), 4, r.description);
  sqlite3_bind_int(st.get(), 5, r.discount_bps);
  BindText(st.get(), 6, StatusText(r.status));
  BindU64(st.get(), 7, r.issued_at_ms);
  BindOptU64(st.get(), 8, r.expires_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::PromotionRecord> SqliteRepository::GetPromotion(Transaction& t, uint64_t id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kPromotionColumns, "FROM promotions WHERE promotion_id=?;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadPromotion(st.get());
}

std::optional<model::PromotionRecord> SqliteRepository::FindIssuedPromotion(Transaction& t, const std::string& code, uint64_t customer_id,
                                                                            uint64_t merchant_id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kPromotionColumns,
                          "FROM promotions WHERE code=? AND customer_id=? AND merchant_id=? AND status='ISSUED' LIMIT 1;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindText(st.get(), 1, code);
  BindU64(st.get(), 2, customer_id);
  BindU64(st.get(), 3, merchant_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadPromotion(st.get());
}

bool SqliteRepository::PromotionCodeExists(Transaction& t, uint64_t merchant_id, const std::string& code) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, "SELECT 1 FROM promotions WHERE merchant_id=? AND code=? LIMIT 1;");
  BindU64(st.get(), 1, merchant_id);
  BindText(st.get(), 2, code);
  return StepRow(db, st.get());
}

std::vector<model::PromotionRecord> SqliteRepository::ListPromotions(Transaction& t, uint64_t customer_id) {
  auto* db  = TX(t).Handle();
  auto  sql = WithColumns(kPromotionColumns, "FROM promotions WHERE customer_id=? ORDER BY promotion_id;");
  auto  st  = PrepareRead(db, sql.c_str());
  BindU64(st.get(), 1, customer_id);

  std::vector<model::PromotionRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadPromotion(st.get()));
  }
  return out;
}

CasResult SqliteRepository::RedeemPromotion(Transaction& t, uint64_t promotion_id, uint64_t customer_id,
                                            const model::PromotionRedemption& redemption) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE promotions SET status='REDEEMED', redeemed_at_ms=?, redeemed_reservation_id=?, redeemed_payment_id=? "
                     "WHERE promotion_id=? AND customer_id=? AND status='ISSUED';");
  if (!st) return CasResult::Failed(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)));

  BindU64(st.get(), 1, redemption.redeemed_at_ms);
  BindU64(st.get(), 2, redemption.reservation_id);
  BindU64(st.get(), 3, redemption.payment_id);
  BindU64(st.get(), 4, promotion_id);
  BindU64(st.get(), 5, customer_id);
  return StepCas(db, st.get());
}

Result SqliteRepository::ExpirePromotions(Transaction& t, uint64_t now_ms, uint64_t& affected) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE promotions SET status='EXPIRED' WHERE status='ISSUED' AND expires_at_ms IS NOT NULL AND expires_at_ms<=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, now_ms);
  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  affected = static_cast<uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Memberships and programs
// ------------------------------------------------------------------

Result SqliteRepository::LockMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id, model::MembershipRecord& out) {
  // BEGIN IMMEDIATE already holds the database write lock.
  auto* db = TX(t).Handle();
  {
    auto st = Prepare(db, "INSERT OR IGNORE INTO loyalty_memberships(customer_id,merchant_id,visits_count,total_visits_count) VALUES(?,?,0,0);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, customer_id);
    BindU64(st.get(), 2, merchant_id);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  auto st = Prepare(db,
                    "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships "
                    "WHERE customer_id=? AND merchant_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, customer_id);
  BindU64(st.get(), 2, merchant_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    return rc == SQLITE_DONE ? Result::Err(ErrorCode::NotFound, "membership vanished after insert") : Translate(db, rc);
  }
  out = ReadMembership(st.get());
  return Result::Ok();
}

Result SqliteRepository::UpdateMembership(Transaction& t, const model::MembershipRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE loyalty_memberships SET visits_count=?, total_visits_count=? WHERE customer_id=? AND merchant_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  sqlite3_bind_int64(st.get(), 1, r.visits_count);
  sqlite3_bind_int64(st.get(), 2, r.total_visits_count);
  BindU64(st.get(), 3, r.customer_id);
  BindU64(st.get(), 4, r.merchant_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) != 1) return Result::Err(ErrorCode::NotFound, "membership not found");
  return Result::Ok();
}

std::optional<model::MembershipRecord> SqliteRepository::GetMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db,
                         "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships "
                         "WHERE customer_id=? AND merchant_id=?;");
  BindU64(st.get(), 1, customer_id);
  BindU64(st.get(), 2, merchant_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadMembership(st.get());
}

std::vector<model::MembershipRecord> SqliteRepository::ListMembershipsWithTotalVisits(Transaction& t, uint64_t merchant_id,
                                                                                      uint32_t min_total_visits) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db,
                         "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships "
                         "WHERE merchant_id=? AND total_visits_count>=? ORDER BY customer_id;");
  BindU64(st.get(), 1, merchant_id);
  sqlite3_bind_int64(st.get(), 2, min_total_visits);

  std::vector<model::MembershipRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadMembership(st.get()));
  }
  return out;
}

Result SqliteRepository::UpsertProgram(Transaction& t, const model::LoyaltyProgramRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO loyalty_programs(merchant_id,target_visits,discount_pct,note,active) VALUES(?,?,?,?,?) "
                     "ON CONFLICT(merchant_id) DO UPDATE SET target_visits=excluded.target_visits, discount_pct=excluded.discount_pct, "
                     "note=excluded.note, active=excluded.active;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.merchant_id);
  sqlite3_bind_int64(st.get(), 2, r.target_visits);
  sqlite3_bind_int(st.get(), 3, r.discount_pct);
  BindText(st.get(), 4, r.note);
  sqlite3_bind_int(st.get(), 5, r.active ? 1 : 0);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LoyaltyProgramRecord> SqliteRepository::FindActiveProgram(Transaction& t, uint64_t merchant_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db,
                         "SELECT merchant_id,target_visits,discount_pct,note,active FROM loyalty_programs "
                         "WHERE merchant_id=? AND active=1;");
  BindU64(st.get(), 1, merchant_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::LoyaltyProgramRecord r;
  r.merchant_id   = ColU64(st.get(), 0);
  r.target_visits = static_cast<uint32_t>(sqlite3_column_int64(st.get(), 1));
  r.discount_pct  = sqlite3_column_int(st.get(), 2);
  r.note          = ColText(st.get(), 3);
  r.active        = sqlite3_column_int(st.get(), 4) != 0;
  return r;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result SqliteRepository::InsertNotification(Transaction& t, model::NotificationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO notifications(recipient_id,merchant_id,sender_email,category,message,reservation_id,payment_id,"
                     "promotion_id,promo_code,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.recipient_id);
  BindU64(st.get(), 2, r.merchant_id);
  BindText(st.get(), 3, r.sender_email);
  BindText(st.get(), 4, r.category);
  BindText(st.get(), 5, r.message);
  BindOptU64(st.get(), 6, r.reservation_id);
  BindOptU64(st.get(), 7, r.payment_id);
  BindOptU64(st.get(), 8, r.promotion_id);
  BindText(st.get(), 9, r.promo_code);
  BindU64(st.get(), 10, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::NotificationRecord> SqliteRepository::ListNotifications(Transaction& t, uint64_t recipient_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db,
                         "SELECT notification_id,recipient_id,merchant_id,sender_email,category,message,reservation_id,payment_id,"
                         "promotion_id,promo_code,created_at_ms FROM notifications WHERE recipient_id=? ORDER BY notification_id;");
  BindU64(st.get(), 1, recipient_id);

  std::vector<model::NotificationRecord> out;
  while (StepRow(db, st.get())) {
    model::NotificationRecord r;
    r.id             = ColU64(st.get(), 0);
    r.recipient_id   = ColU64(st.get(), 1);
    r.merchant_id    = ColU64(st.get(), 2);
    r.sender_email   = ColText(st.get(), 3);
    r.category       = ColText(st.get(), 4);
    r.message        = ColText(st.get(), 5);
    r.reservation_id = ColOptU64(st.get(), 6);
    r.payment_id     = ColOptU64(st.get(), 7);
    r.promotion_id   = ColOptU64(st.get(), 8);
    r.promo_code     = ColText(st.get(), 9);
    r.created_at_ms  = ColU64(st.get(), 10);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace strands::db::sqlite
