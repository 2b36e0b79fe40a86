#include "pg_repository.hpp"

#include <stdexcept>

namespace strands::db::postgres {

using strands::model::LoyaltySeen;
using strands::model::PromotionStatus;
using strands::model::ReservationStatus;

namespace {

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::string StatusText(ReservationStatus s) {
  return std::string(strands::model::ToString(s));
}

std::string StatusText(PromotionStatus s) {
  return std::string(strands::model::ToString(s));
}

CasResult FromAffected(const pqxx::result& res) {
  return res.affected_rows() == 1 ? CasResult::Swapped() : CasResult::Missed();
}

constexpr const char* kReservationSelect =
    "SELECT reservation_id,customer_id,merchant_id,scheduled_start_ms,scheduled_end_ms,status,loyalty_seen,created_at_ms "
    "FROM reservations ";

model::ReservationRecord ReadReservation(const pqxx::row& row) {
  model::ReservationRecord r;
  r.id                 = row[0].as<uint64_t>();
  r.customer_id        = row[1].as<uint64_t>();
  r.merchant_id        = row[2].as<uint64_t>();
  r.scheduled_start_ms = row[3].as<uint64_t>();
  r.scheduled_end_ms   = row[4].as<uint64_t>();

  auto status = strands::model::ParseReservationStatus(row[5].c_str());
  if (!status) throw std::runtime_error(std::string("corrupt reservation status: ") + row[5].c_str());
  r.status = *status;

  r.loyalty_seen  = static_cast<LoyaltySeen>(row[6].as<int>());
  r.created_at_ms = row[7].as<uint64_t>();
  return r;
}

constexpr const char* kPaymentSelect =
    "SELECT payment_id,customer_id,reservation_id,order_id,instrument_id,billing_address_id,reward_id,promotion_id,amount_cents,"
    "created_at_ms FROM payments ";

model::PaymentRecord ReadPayment(const pqxx::row& row) {
  model::PaymentRecord r;
  r.id                 = row[0].as<uint64_t>();
  r.customer_id        = row[1].as<uint64_t>();
  r.reservation_id     = OptU64(row[2]);
  r.order_id           = OptU64(row[3]);
  r.instrument_id      = row[4].as<uint64_t>();
  r.billing_address_id = row[5].as<uint64_t>();
  r.reward_id          = OptU64(row[6]);
  r.promotion_id       = OptU64(row[7]);
  r.amount_cents       = row[8].as<int64_t>();
  r.created_at_ms      = row[9].as<uint64_t>();
  return r;
}

constexpr const char* kRewardSelect =
    "SELECT reward_id,customer_id,merchant_id,discount_pct,note,active,redeemed_at_ms,created_at_ms FROM rewards ";

model::RewardRecord ReadReward(const pqxx::row& row) {
  model::RewardRecord r;
  r.id             = row[0].as<uint64_t>();
  r.customer_id    = row[1].as<uint64_t>();
  r.merchant_id    = row[2].as<uint64_t>();
  r.discount_pct   = row[3].as<int32_t>();
  r.note           = row[4].c_str();
  r.active         = row[5].as<bool>();
  r.redeemed_at_ms = OptU64(row[6]);
  r.created_at_ms  = row[7].as<uint64_t>();
  return r;
}

constexpr const char* kPromotionSelect =
    "SELECT promotion_id,customer_id,merchant_id,code,description,discount_bps,status,issued_at_ms,expires_at_ms,redeemed_at_ms,"
    "redeemed_reservation_id,redeemed_payment_id FROM promotions ";

model::PromotionRecord ReadPromotion(const pqxx::row& row) {
  model::PromotionRecord r;
  r.id           = row[0].as<uint64_t>();
  r.customer_id  = row[1].as<uint64_t>();
  r.merchant_id  = row[2].as<uint64_t>();
  r.code         = row[3].c_str();
  r.description  = row[4].c_str();
  r.discount_bps = row[5].as<int32_t>();

  auto status = strands::model::ParsePromotionStatus(row[6].c_str());
  if (!status) throw std::runtime_error(std::string("corrupt promotion status: ") + row[6].c_str());
  r.status = *status;

  r.issued_at_ms            = row[7].as<uint64_t>();
  r.expires_at_ms           = OptU64(row[8]);
  r.redeemed_at_ms          = OptU64(row[9]);
  r.redeemed_reservation_id = OptU64(row[10]);
  r.redeemed_payment_id     = OptU64(row[11]);
  return r;
}

model::MembershipRecord ReadMembership(const pqxx::row& row) {
  model::MembershipRecord r;
  r.customer_id        = row[0].as<uint64_t>();
  r.merchant_id        = row[1].as<uint64_t>();
  r.visits_count       = row[2].as<uint32_t>();
  r.total_visits_count = row[3].as<uint32_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Merchants and accounts
// ------------------------------------------------------------------

Result PgRepository::InsertMerchant(Transaction& t, const model::MerchantRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO merchants(merchant_id,owner_user_id,name,sender_email) VALUES($1,$2,$3,$4);", r.id,
                             r.owner_user_id, r.name, r.sender_email);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MerchantRecord> PgRepository::GetMerchant(Transaction& t, uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params("SELECT merchant_id,owner_user_id,name,sender_email FROM merchants WHERE merchant_id=$1;",
                                      merchant_id);
  if (res.empty()) return std::nullopt;

  model::MerchantRecord r;
  r.id            = res[0][0].as<uint64_t>();
  r.owner_user_id = res[0][1].as<uint64_t>();
  r.name          = res[0][2].c_str();
  r.sender_email  = res[0][3].c_str();
  return r;
}

Result PgRepository::InsertInstrument(Transaction& t, const model::InstrumentRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO payment_instruments(instrument_id,user_id) VALUES($1,$2);", r.id, r.user_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertBillingAddress(Transaction& t, const model::BillingAddressRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO billing_addresses(billing_address_id,user_id) VALUES($1,$2);", r.id, r.user_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::InstrumentBelongsTo(Transaction& t, uint64_t instrument_id, uint64_t user_id) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM payment_instruments WHERE instrument_id=$1 AND user_id=$2;", instrument_id,
                                      user_id);
  return !res.empty();
}

bool PgRepository::BillingAddressBelongsTo(Transaction& t, uint64_t address_id, uint64_t user_id) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM billing_addresses WHERE billing_address_id=$1 AND user_id=$2;", address_id,
                                      user_id);
  return !res.empty();
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result PgRepository::InsertReservation(Transaction& t, model::ReservationRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  res = r.id == 0
                    ? w.exec_params("INSERT INTO reservations(customer_id,merchant_id,scheduled_start_ms,scheduled_end_ms,status,"
                                    "loyalty_seen,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING reservation_id;",
                                    r.customer_id, r.merchant_id, r.scheduled_start_ms, r.scheduled_end_ms, StatusText(r.status),
                                    static_cast<int>(r.loyalty_seen), r.created_at_ms)
                    : w.exec_params("INSERT INTO reservations(reservation_id,customer_id,merchant_id,scheduled_start_ms,"
                                    "scheduled_end_ms,status,loyalty_seen,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
                                    "RETURNING reservation_id;",
                                    r.id, r.customer_id, r.merchant_id, r.scheduled_start_ms, r.scheduled_end_ms,
                                    StatusText(r.status), static_cast<int>(r.loyalty_seen), r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertReservationService(Transaction& t, const model::ReservationServiceRecord& r) {
  try {
    std::optional<uint64_t> staff;
    if (r.staff_id != 0) staff = r.staff_id;
    TX(t).Work().exec_params(
        "INSERT INTO reservation_services(reservation_id,service_id,staff_id,price_cents,duration_minutes) VALUES($1,$2,$3,$4,$5);",
        r.reservation_id, r.service_id, staff, r.price_cents, r.duration_minutes);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReservationRecord> PgRepository::GetReservation(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_reservation", id);
  if (res.empty()) return std::nullopt;
  return ReadReservation(res[0]);
}

std::vector<model::ReservationServiceRecord> PgRepository::ListReservationServices(Transaction& t, uint64_t reservation_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT reservation_id,service_id,COALESCE(staff_id,0),price_cents,duration_minutes FROM reservation_services "
      "WHERE reservation_id=$1 ORDER BY ctid;",
      reservation_id);

  std::vector<model::ReservationServiceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ReservationServiceRecord r;
    r.reservation_id   = row[0].as<uint64_t>();
    r.service_id       = row[1].as<uint64_t>();
    r.staff_id         = row[2].as<uint64_t>();
    r.price_cents      = row[3].as<int64_t>();
    r.duration_minutes = row[4].as<uint32_t>();
    out.push_back(r);
  }
  return out;
}

uint64_t PgRepository::CountReservations(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM reservations WHERE customer_id=$1 AND merchant_id=$2;", customer_id,
                                      merchant_id);
  return res[0][0].as<uint64_t>();
}

CasResult PgRepository::TransitionReservation(Transaction& t, uint64_t id, ReservationStatus from, ReservationStatus to) {
  try {
    return FromAffected(TX(t).Work().exec_prepared("transition_reservation", id, StatusText(from), StatusText(to)));
  } catch (const std::exception& e) {
    return CasResult::Failed(Translate(e));
  }
}

CasResult PgRepository::DeletePendingReservation(Transaction& t, uint64_t id, uint64_t customer_id) {
  try {
    return FromAffected(TX(t).Work().exec_params(
        "DELETE FROM reservations WHERE reservation_id=$1 AND customer_id=$2 AND status='PENDING';", id, customer_id));
  } catch (const std::exception& e) {
    return CasResult::Failed(Translate(e));
  }
}

// ------------------------------------------------------------------
// Loyalty bookkeeping
// ------------------------------------------------------------------

std::vector<model::ReservationRecord> PgRepository::ListAccrualCandidates(Transaction& t, uint64_t now_ms, std::size_t limit) {
  std::optional<int64_t> bound;
  if (limit != 0) bound = static_cast<int64_t>(limit);

  auto res = TX(t).Work().exec_params(std::string(kReservationSelect) +
                                          "WHERE status='COMPLETED' AND loyalty_seen=0 AND scheduled_end_ms<$1 "
                                          "ORDER BY reservation_id LIMIT $2;",
                                      now_ms, bound);

  std::vector<model::ReservationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadReservation(row));
  }
  return out;
}

CasResult PgRepository::MarkLoyaltySeen(Transaction& t, uint64_t reservation_id, LoyaltySeen from, LoyaltySeen to) {
  try {
    return FromAffected(TX(t).Work().exec_params(
        "UPDATE reservations SET loyalty_seen=$2 WHERE reservation_id=$1 AND loyalty_seen=$3;", reservation_id,
        static_cast<int>(to), static_cast<int>(from)));
  } catch (const std::exception& e) {
    return CasResult::Failed(Translate(e));
  }
}

Result PgRepository::MarkCanceledLoyaltySeen(Transaction& t, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec("UPDATE reservations SET loyalty_seen=2 WHERE status='CANCELED' AND loyalty_seen=0;");
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result PgRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_payment", r.customer_id, r.reservation_id, r.order_id, r.instrument_id,
                                          r.billing_address_id, r.reward_id, r.promotion_id, r.amount_cents,
                                          std::string(strands::model::ToString(r.status)), r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPayment(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentSelect) + "WHERE payment_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadPayment(res[0]);
}

std::vector<model::PaymentRecord> PgRepository::ListPaymentsForReservation(Transaction& t, uint64_t reservation_id) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentSelect) + "WHERE reservation_id=$1 ORDER BY payment_id;", reservation_id);

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPayment(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Rewards
// ------------------------------------------------------------------

Result PgRepository::InsertReward(Transaction& t, model::RewardRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO rewards(customer_id,merchant_id,discount_pct,note,active,redeemed_at_ms,created_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING reward_id;",
        r.customer_id, r.merchant_id, r.discount_pct, r.note, r.active, r.redeemed_at_ms, r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RewardRecord> PgRepository::GetReward(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kRewardSelect) + "WHERE reward_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadReward(res[0]);
}

std::optional<model::RewardRecord> PgRepository::FindRedeemableReward(Transaction& t, uint64_t reward_id, uint64_t customer_id,
                                                                      uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params(
      std::string(kRewardSelect) +
          "WHERE reward_id=$1 AND customer_id=$2 AND merchant_id=$3 AND active AND redeemed_at_ms IS NULL;",
      reward_id, customer_id, merchant_id);
  if (res.empty()) return std::nullopt;
  return ReadReward(res[0]);
}

CasResult PgRepository::RedeemReward(Transaction& t, uint64_t reward_id, uint64_t customer_id, uint64_t merchant_id,
                                     uint64_t redeemed_at_ms) {
  try {
    return FromAffected(TX(t).Work().exec_prepared("redeem_reward", reward_id, customer_id, merchant_id, redeemed_at_ms));
  } catch (const std::exception& e) {
    return CasResult::Failed(Translate(e));
  }
}

std::vector<model::RewardRecord> PgRepository::ListRewards(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params(std::string(kRewardSelect) + "WHERE customer_id=$1 AND merchant_id=$2 ORDER BY reward_id;",
                                      customer_id, merchant_id);

  std::vector<model::RewardRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadReward(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Promotions
// ------------------------------------------------------------------

Result PgRepository::InsertPromotion(Transaction& t, model::PromotionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO promotions(customer_id,merchant_id,code,description,discount_bps,status,issued_at_ms,expires_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING promotion_id;",
        r.customer_id, r.merchant_id, r.code, r.description, r.discount_bps, StatusText(r.status), r.issued_at_ms, r.expires_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PromotionRecord> PgRepository::GetPromotion(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kPromotionSelect) + "WHERE promotion_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadPromotion(res[0]);
}

std::optional<model::PromotionRecord> PgRepository::FindIssuedPromotion(Transaction& t, const std::string& code, uint64_t customer_id,
                                                                        uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params(
      std::string(kPromotionSelect) + "WHERE code=$1 AND customer_id=$2 AND merchant_id=$3 AND status='ISSUED' LIMIT 1;", code,
      customer_id, merchant_id);
  if (res.empty()) return std::nullopt;
  return ReadPromotion(res[0]);
}

bool PgRepository::PromotionCodeExists(Transaction& t, uint64_t merchant_id, const std::string& code) {
  auto res = TX(t).Work().exec_params("SELECT 1 FROM promotions WHERE merchant_id=$1 AND code=$2 LIMIT 1;", merchant_id, code);
  return !res.empty();
}

std::vector<model::PromotionRecord> PgRepository::ListPromotions(Transaction& t, uint64_t customer_id) {
  auto res = TX(t).Work().exec_params(std::string(kPromotionSelect) + "WHERE customer_id=$1 ORDER BY promotion_id;", customer_id);

  std::vector<model::PromotionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPromotion(row));
  }
  return out;
}

CasResult PgRepository::RedeemPromotion(Transaction& t, uint64_t promotion_id, uint64_t customer_id,
                                        const model::PromotionRedemption& redemption) {
  try {
    return FromAffected(TX(t).Work().exec_prepared("redeem_promotion", promotion_id, customer_id, redemption.redeemed_at_ms,
                                                   redemption.reservation_id, redemption.payment_id));
  } catch (const std::exception& e) {
    return CasResult::Failed(Translate(e));
  }
}

Result PgRepository::ExpirePromotions(Transaction& t, uint64_t now_ms, uint64_t& affected) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE promotions SET status='EXPIRED' WHERE status='ISSUED' AND expires_at_ms IS NOT NULL AND expires_at_ms<=$1;", now_ms);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Memberships and programs
// ------------------------------------------------------------------

Result PgRepository::LockMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id, model::MembershipRecord& out) {
  try {
    auto& w = TX(t).Work();
    w.exec_params(
        "INSERT INTO loyalty_memberships(customer_id,merchant_id,visits_count,total_visits_count) VALUES($1,$2,0,0) "
        "ON CONFLICT (customer_id, merchant_id) DO NOTHING;",
        customer_id, merchant_id);

    // Row lock held until commit; concurrent accruals for the pair queue here.
    auto res = w.exec_prepared("lock_membership", customer_id, merchant_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "membership vanished after insert");
    out = ReadMembership(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateMembership(Transaction& t, const model::MembershipRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE loyalty_memberships SET visits_count=$3, total_visits_count=$4 WHERE customer_id=$1 AND merchant_id=$2;",
        r.customer_id, r.merchant_id, r.visits_count, r.total_visits_count);
    if (res.affected_rows() != 1) return Result::Err(ErrorCode::NotFound, "membership not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MembershipRecord> PgRepository::GetMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships WHERE customer_id=$1 AND merchant_id=$2;",
      customer_id, merchant_id);
  if (res.empty()) return std::nullopt;
  return ReadMembership(res[0]);
}

std::vector<model::MembershipRecord> PgRepository::ListMembershipsWithTotalVisits(Transaction& t, uint64_t merchant_id,
                                                                                  uint32_t min_total_visits) {
  auto res = TX(t).Work().exec_params(
      "SELECT customer_id,merchant_id,visits_count,total_visits_count FROM loyalty_memberships "
      "WHERE merchant_id=$1 AND total_visits_count>=$2 ORDER BY customer_id;",
      merchant_id, min_total_visits);

  std::vector<model::MembershipRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMembership(row));
  }
  return out;
}

Result PgRepository::UpsertProgram(Transaction& t, const model::LoyaltyProgramRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO loyalty_programs(merchant_id,target_visits,discount_pct,note,active) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT (merchant_id) DO UPDATE SET target_visits=EXCLUDED.target_visits, discount_pct=EXCLUDED.discount_pct, "
        "note=EXCLUDED.note, active=EXCLUDED.active;",
        r.merchant_id, r.target_visits, r.discount_pct, r.note, r.active);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LoyaltyProgramRecord> PgRepository::FindActiveProgram(Transaction& t, uint64_t merchant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT merchant_id,target_visits,discount_pct,note,active FROM loyalty_programs WHERE merchant_id=$1 AND active;",
      merchant_id);
  if (res.empty()) return std::nullopt;

  model::LoyaltyProgramRecord r;
  r.merchant_id   = res[0][0].as<uint64_t>();
  r.target_visits = res[0][1].as<uint32_t>();
  r.discount_pct  = res[0][2].as<int32_t>();
  r.note          = res[0][3].c_str();
  r.active        = res[0][4].as<bool>();
  return r;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result PgRepository::InsertNotification(Transaction& t, model::NotificationRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO notifications(recipient_id,merchant_id,sender_email,category,message,reservation_id,payment_id,promotion_id,"
        "promo_code,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING notification_id;",
        r.recipient_id, r.merchant_id, r.sender_email, r.category, r.message, r.reservation_id, r.payment_id, r.promotion_id,
        r.promo_code, r.created_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::NotificationRecord> PgRepository::ListNotifications(Transaction& t, uint64_t recipient_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT notification_id,recipient_id,merchant_id,sender_email,category,message,reservation_id,payment_id,promotion_id,"
      "promo_code,created_at_ms FROM notifications WHERE recipient_id=$1 ORDER BY notification_id;",
      recipient_id);

  std::vector<model::NotificationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::NotificationRecord r;
    r.id             = row[0].as<uint64_t>();
    r.recipient_id   = row[1].as<uint64_t>();
    r.merchant_id    = row[2].as<uint64_t>();
    r.sender_email   = row[3].c_str();
    r.category       = row[4].c_str();
    r.message        = row[5].c_str();
    r.reservation_id = OptU64(row[6]);
    r.payment_id     = OptU64(row[7]);
    r.promotion_id   = OptU64(row[8]);
    r.promo_code     = row[9].c_str();
    r.created_at_ms  = row[10].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace strands::db::postgres
