#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace strands::testing {

/*
  Repository that forwards every call to an inner backend. Tests derive
  from it and override the few calls they need to steer.
*/
class ForwardingRepository : public db::Repository {
 public:
  explicit ForwardingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {}

  db::Repository& Inner() { return *inner_; }

  std::unique_ptr<db::Transaction> Begin() override { return inner_->Begin(); }

  db::Result InsertMerchant(db::Transaction& tx, const db::model::MerchantRecord& r) override { return inner_->InsertMerchant(tx, r); }
  std::optional<db::model::MerchantRecord> GetMerchant(db::Transaction& tx, uint64_t id) override { return inner_->GetMerchant(tx, id); }
  db::Result InsertInstrument(db::Transaction& tx, const db::model::InstrumentRecord& r) override { return inner_->InsertInstrument(tx, r); }
  db::Result InsertBillingAddress(db::Transaction& tx, const db::model::BillingAddressRecord& r) override {
    return inner_->InsertBillingAddress(tx, r);
  }
  bool InstrumentBelongsTo(db::Transaction& tx, uint64_t id, uint64_t user) override { return inner_->InstrumentBelongsTo(tx, id, user); }
  bool BillingAddressBelongsTo(db::Transaction& tx, uint64_t id, uint64_t user) override {
    return inner_->BillingAddressBelongsTo(tx, id, user);
  }

  db::Result InsertReservation(db::Transaction& tx, db::model::ReservationRecord& r) override { return inner_->InsertReservation(tx, r); }
  db::Result InsertReservationService(db::Transaction& tx, const db::model::ReservationServiceRecord& r) override {
    return inner_->InsertReservationService(tx, r);
  }
  std::optional<db::model::ReservationRecord> GetReservation(db::Transaction& tx, uint64_t id) override {
    return inner_->GetReservation(tx, id);
  }
  std::vector<db::model::ReservationServiceRecord> ListReservationServices(db::Transaction& tx, uint64_t id) override {
    return inner_->ListReservationServices(tx, id);
  }
  uint64_t CountReservations(db::Transaction& tx, uint64_t customer, uint64_t merchant) override {
    return inner_->CountReservations(tx, customer, merchant);
  }
  db::CasResult TransitionReservation(db::Transaction& tx, uint64_t id, model::ReservationStatus from,
                                      model::ReservationStatus to) override {
    return inner_->TransitionReservation(tx, id, from, to);
  }
  db::CasResult DeletePendingReservation(db::Transaction& tx, uint64_t id, uint64_t customer) override {
    return inner_->DeletePendingReservation(tx, id, customer);
  }

  std::vector<db::model::ReservationRecord> ListAccrualCandidates(db::Transaction& tx, uint64_t now_ms, std::size_t limit) override {
    return inner_->ListAccrualCandidates(tx, now_ms, limit);
  }
  db::CasResult MarkLoyaltySeen(db::Transaction& tx, uint64_t id, model::LoyaltySeen from, model::LoyaltySeen to) override {
    return inner_->MarkLoyaltySeen(tx, id, from, to);
  }
  db::Result MarkCanceledLoyaltySeen(db::Transaction& tx, uint64_t& affected) override {
    return inner_->MarkCanceledLoyaltySeen(tx, affected);
  }

  db::Result InsertPayment(db::Transaction& tx, db::model::PaymentRecord& r) override { return inner_->InsertPayment(tx, r); }
  std::optional<db::model::PaymentRecord> GetPayment(db::Transaction& tx, uint64_t id) override { return inner_->GetPayment(tx, id); }
  std::vector<db::model::PaymentRecord> ListPaymentsForReservation(db::Transaction& tx, uint64_t id) override {
    return inner_->ListPaymentsForReservation(tx, id);
  }

  db::Result InsertReward(db::Transaction& tx, db::model::RewardRecord& r) override { return inner_->InsertReward(tx, r); }
  std::optional<db::model::RewardRecord> GetReward(db::Transaction& tx, uint64_t id) override { return inner_->GetReward(tx, id); }
  std::optional<db::model::RewardRecord> FindRedeemableReward(db::Transaction& tx, uint64_t id, uint64_t customer,
                                                              uint64_t merchant) override {
    return inner_->FindRedeemableReward(tx, id, customer, merchant);
  }
  db::CasResult RedeemReward(db::Transaction& tx, uint64_t id, uint64_t customer, uint64_t merchant, uint64_t at_ms) override {
    return inner_->RedeemReward(tx, id, customer, merchant, at_ms);
  }
  std::vector<db::model::RewardRecord> ListRewards(db::Transaction& tx, uint64_t customer, uint64_t merchant) override {
    return inner_->ListRewards(tx, customer, merchant);
  }

  db::Result InsertPromotion(db::Transaction& tx, db::model::PromotionRecord& r) override { return inner_->InsertPromotion(tx, r); }
  std::optional<db::model::PromotionRecord> GetPromotion(db::Transaction& tx, uint64_t id) override {
    return inner_->GetPromotion(tx, id);
  }
  std::optional<db::model::PromotionRecord> FindIssuedPromotion(db::Transaction& tx, const std::string& code, uint64_t customer,
                                                                uint64_t merchant) override {
    return inner_->FindIssuedPromotion(tx, code, customer, merchant);
  }
  bool PromotionCodeExists(db::Transaction& tx, uint64_t merchant, const std::string& code) override {
    return inner_->PromotionCodeExists(tx, merchant, code);
  }
  std::vector<db::model::PromotionRecord> ListPromotions(db::Transaction& tx, uint64_t customer) override {
    return inner_->ListPromotions(tx, customer);
  }
  db::CasResult RedeemPromotion(db::Transaction& tx, uint64_t id, uint64_t customer, const db::model::PromotionRedemption& r) override {
    return inner_->RedeemPromotion(tx, id, customer, r);
  }
  db::Result ExpirePromotions(db::Transaction& tx, uint64_t now_ms, uint64_t& affected) override {
    return inner_->ExpirePromotions(tx, now_ms, affected);
  }

  db::Result LockMembership(db::Transaction& tx, uint64_t customer, uint64_t merchant, db::model::MembershipRecord& out) override {
    return inner_->LockMembership(tx, customer, merchant, out);
  }
  db::Result UpdateMembership(db::Transaction& tx, const db::model::MembershipRecord& r) override { return inner_->UpdateMembership(tx, r); }
  std::optional<db::model::MembershipRecord> GetMembership(db::Transaction& tx, uint64_t customer, uint64_t merchant) override {
    return inner_->GetMembership(tx, customer, merchant);
  }
  std::vector<db::model::MembershipRecord> ListMembershipsWithTotalVisits(db::Transaction& tx, uint64_t merchant,
                                                                          uint32_t min_total_visits) override {
    return inner_->ListMembershipsWithTotalVisits(tx, merchant, min_total_visits);
  }
  db::Result UpsertProgram(db::Transaction& tx, const db::model::LoyaltyProgramRecord& r) override { return inner_->UpsertProgram(tx, r); }
  std::optional<db::model::LoyaltyProgramRecord> FindActiveProgram(db::Transaction& tx, uint64_t merchant) override {
    return inner_->FindActiveProgram(tx, merchant);
  }

  db::Result InsertNotification(db::Transaction& tx, db::model::NotificationRecord& r) override { return inner_->InsertNotification(tx, r); }
  std::vector<db::model::NotificationRecord> ListNotifications(db::Transaction& tx, uint64_t recipient) override {
    return inner_->ListNotifications(tx, recipient);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace strands::testing
