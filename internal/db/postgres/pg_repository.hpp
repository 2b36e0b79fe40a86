#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace strands::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertMerchant(Transaction&, const model::MerchantRecord&) override;
  std::optional<model::MerchantRecord> GetMerchant(Transaction&, uint64_t) override;
  Result InsertInstrument(Transaction&, const model::InstrumentRecord&) override;
  Result InsertBillingAddress(Transaction&, const model::BillingAddressRecord&) override;
  bool InstrumentBelongsTo(Transaction&, uint64_t, uint64_t) override;
  bool BillingAddressBelongsTo(Transaction&, uint64_t, uint64_t) override;

  Result InsertReservation(Transaction&, model::ReservationRecord&) override;
  Result InsertReservationService(Transaction&, const model::ReservationServiceRecord&) override;
  std::optional<model::ReservationRecord> GetReservation(Transaction&, uint64_t) override;
  std::vector<model::ReservationServiceRecord> ListReservationServices(Transaction&, uint64_t) override;
  uint64_t CountReservations(Transaction&, uint64_t, uint64_t) override;
  CasResult TransitionReservation(Transaction&, uint64_t, strands::model::ReservationStatus,
                                  strands::model::ReservationStatus) override;
  CasResult DeletePendingReservation(Transaction&, uint64_t, uint64_t) override;

  std::vector<model::ReservationRecord> ListAccrualCandidates(Transaction&, uint64_t, std::size_t) override;
  CasResult MarkLoyaltySeen(Transaction&, uint64_t, strands::model::LoyaltySeen, strands::model::LoyaltySeen) override;
  Result MarkCanceledLoyaltySeen(Transaction&, uint64_t&) override;

  Result InsertPayment(Transaction&, model::PaymentRecord&) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, uint64_t) override;
  std::vector<model::PaymentRecord> ListPaymentsForReservation(Transaction&, uint64_t) override;

  Result InsertReward(Transaction&, model::RewardRecord&) override;
  std::optional<model::RewardRecord> GetReward(Transaction&, uint64_t) override;
  std::optional<model::RewardRecord> FindRedeemableReward(Transaction&, uint64_t, uint64_t, uint64_t) override;
  CasResult RedeemReward(Transaction&, uint64_t, uint64_t, uint64_t, uint64_t) override;
  std::vector<model::RewardRecord> ListRewards(Transaction&, uint64_t, uint64_t) override;

  Result InsertPromotion(Transaction&, model::PromotionRecord&) override;
  std::optional<model::PromotionRecord> GetPromotion(Transaction&, uint64_t) override;
  std::optional<model::PromotionRecord> FindIssuedPromotion(Transaction&, const std::string&, uint64_t, uint64_t) override;
  bool PromotionCodeExists(Transaction&, uint64_t, const std::string&) override;
  std::vector<model::PromotionRecord> ListPromotions(Transaction&, uint64_t) override;
  CasResult RedeemPromotion(Transaction&, uint64_t, uint64_t, const model::PromotionRedemption&) override;
  Result ExpirePromotions(Transaction&, uint64_t, uint64_t&) override;

  Result LockMembership(Transaction&, uint64_t, uint64_t, model::MembershipRecord&) override;
  Result UpdateMembership(Transaction&, const model::MembershipRecord&) override;
  std::optional<model::MembershipRecord> GetMembership(Transaction&, uint64_t, uint64_t) override;
  std::vector<model::MembershipRecord> ListMembershipsWithTotalVisits(Transaction&, uint64_t, uint32_t) override;
  Result UpsertProgram(Transaction&, const model::LoyaltyProgramRecord&) override;
  std::optional<model::LoyaltyProgramRecord> FindActiveProgram(Transaction&, uint64_t) override;

  Result InsertNotification(Transaction&, model::NotificationRecord&) override;
  std::vector<model::NotificationRecord> ListNotifications(Transaction&, uint64_t) override;

private:
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace strands::db::postgres
