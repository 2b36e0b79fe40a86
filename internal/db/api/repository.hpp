#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/loyalty_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/promotion_record.hpp"
#include "internal/db/model/reservation_record.hpp"
#include "internal/db/model/reward_record.hpp"

namespace strands::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Conditional updates (CasResult) carry their whole expected state
    in the predicate and report swapped only for exactly one row
  - Reads throw std::runtime_error on backend failure; absence is
    never used to report an error

  The DB is the source of truth for:
    reservations and their loyalty bookkeeping
    payments
    rewards, promotions, memberships
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Merchants and accounts (ownership only)
  // ---------------------------------------------------------------------

  virtual Result InsertMerchant(Transaction&, const model::MerchantRecord&) = 0;

  virtual std::optional<model::MerchantRecord> GetMerchant(Transaction&, uint64_t merchant_id) = 0;

  virtual Result InsertInstrument(Transaction&, const model::InstrumentRecord&) = 0;

  virtual Result InsertBillingAddress(Transaction&, const model::BillingAddressRecord&) = 0;

  virtual bool InstrumentBelongsTo(Transaction&, uint64_t instrument_id, uint64_t user_id) = 0;

  virtual bool BillingAddressBelongsTo(Transaction&, uint64_t address_id, uint64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Reservations
  // ---------------------------------------------------------------------

  // Assigns record.id when it is 0.
  virtual Result InsertReservation(Transaction&, model::ReservationRecord&) = 0;

  virtual Result InsertReservationService(Transaction&, const model::ReservationServiceRecord&) = 0;

  virtual std::optional<model::ReservationRecord> GetReservation(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::ReservationServiceRecord> ListReservationServices(Transaction&, uint64_t reservation_id) = 0;

  virtual uint64_t CountReservations(Transaction&, uint64_t customer_id, uint64_t merchant_id) = 0;

  // UPDATE ... SET status=to WHERE id=? AND status=from
  virtual CasResult TransitionReservation(Transaction&, uint64_t id, strands::model::ReservationStatus from,
                                          strands::model::ReservationStatus to) = 0;

  // DELETE ... WHERE id=? AND customer=? AND status=PENDING
  virtual CasResult DeletePendingReservation(Transaction&, uint64_t id, uint64_t customer_id) = 0;

  // ---------------------------------------------------------------------
  // Loyalty bookkeeping on reservations
  // ---------------------------------------------------------------------

  // COMPLETED, unprocessed, scheduled end before now. limit 0 = no limit.
  virtual std::vector<model::ReservationRecord> ListAccrualCandidates(Transaction&, uint64_t now_ms, std::size_t limit) = 0;

  virtual CasResult MarkLoyaltySeen(Transaction&, uint64_t reservation_id, strands::model::LoyaltySeen from,
                                    strands::model::LoyaltySeen to) = 0;

  // Flags every CANCELED + unprocessed reservation as canceled-processed.
  virtual Result MarkCanceledLoyaltySeen(Transaction&, uint64_t& affected) = 0;

  // ---------------------------------------------------------------------
  // Payments (insert-only)
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertPayment(Transaction&, model::PaymentRecord&) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::PaymentRecord> ListPaymentsForReservation(Transaction&, uint64_t reservation_id) = 0;

  // ---------------------------------------------------------------------
  // Rewards
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertReward(Transaction&, model::RewardRecord&) = 0;

  virtual std::optional<model::RewardRecord> GetReward(Transaction&, uint64_t id) = 0;

  // (id, customer, merchant, active, unredeemed)
  virtual std::optional<model::RewardRecord> FindRedeemableReward(Transaction&, uint64_t reward_id, uint64_t customer_id,
                                                                  uint64_t merchant_id) = 0;

  virtual CasResult RedeemReward(Transaction&, uint64_t reward_id, uint64_t customer_id, uint64_t merchant_id,
                                 uint64_t redeemed_at_ms) = 0;

  virtual std::vector<model::RewardRecord> ListRewards(Transaction&, uint64_t customer_id, uint64_t merchant_id) = 0;

  // ---------------------------------------------------------------------
  // Promotions
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists/ConstraintViolation on a duplicate code.
  virtual Result InsertPromotion(Transaction&, model::PromotionRecord&) = 0;

  virtual std::optional<model::PromotionRecord> GetPromotion(Transaction&, uint64_t id) = 0;

  // (code, customer, merchant, status=ISSUED); expiry is not evaluated here.
  virtual std::optional<model::PromotionRecord> FindIssuedPromotion(Transaction&, const std::string& code,
                                                                    uint64_t customer_id, uint64_t merchant_id) = 0;

  virtual bool PromotionCodeExists(Transaction&, uint64_t merchant_id, const std::string& code) = 0;

  virtual std::vector<model::PromotionRecord> ListPromotions(Transaction&, uint64_t customer_id) = 0;

  // ISSUED -> REDEEMED for (id, customer)
  virtual CasResult RedeemPromotion(Transaction&, uint64_t promotion_id, uint64_t customer_id,
                                    const model::PromotionRedemption&) = 0;

  // ISSUED -> EXPIRED for every row whose expiry is at or before now.
  virtual Result ExpirePromotions(Transaction&, uint64_t now_ms, uint64_t& affected) = 0;

  // ---------------------------------------------------------------------
  // Loyalty memberships and programs
  // ---------------------------------------------------------------------

  /*
    Loads the (customer, merchant) membership under an exclusive lock
    held until the transaction ends, inserting it at zero visits first
    if absent.
  */
  virtual Result LockMembership(Transaction&, uint64_t customer_id, uint64_t merchant_id, model::MembershipRecord& out) = 0;

  virtual Result UpdateMembership(Transaction&, const model::MembershipRecord&) = 0;

  virtual std::optional<model::MembershipRecord> GetMembership(Transaction&, uint64_t customer_id, uint64_t merchant_id) = 0;

  virtual std::vector<model::MembershipRecord> ListMembershipsWithTotalVisits(Transaction&, uint64_t merchant_id,
                                                                              uint32_t min_total_visits) = 0;

  virtual Result UpsertProgram(Transaction&, const model::LoyaltyProgramRecord&) = 0;

  virtual std::optional<model::LoyaltyProgramRecord> FindActiveProgram(Transaction&, uint64_t merchant_id) = 0;

  // ---------------------------------------------------------------------
  // Notification inbox
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertNotification(Transaction&, model::NotificationRecord&) = 0;

  virtual std::vector<model::NotificationRecord> ListNotifications(Transaction&, uint64_t recipient_id) = 0;
};

} // namespace strands::db
