#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace strands::testing {

inline constexpr uint64_t kOwner    = 900;
inline constexpr uint64_t kCustomer = 100;
inline constexpr uint64_t kOther    = 200;
inline constexpr uint64_t kMerchant = 10;
inline constexpr uint64_t kCard     = 55;
inline constexpr uint64_t kAddress  = 66;

// Captures emitted notifications; can be told to fail every Emit().
class RecordingSink final : public notify::NotificationSink {
 public:
  void Emit(const notify::NotificationRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
      throw std::runtime_error("delivery down");
    }
    sent_.push_back(request);
  }

  std::vector<notify::NotificationRequest> Sent() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  bool fail = false;

 private:
  std::mutex                               mutex_;
  std::vector<notify::NotificationRequest> sent_;
};

// Runs fn, which must throw a util::Error, and returns its reason.
template <typename Fn>
util::RejectReason RejectionOf(Fn&& fn) {
  try {
    fn();
  } catch (const util::Error& e) {
    return e.Reason();
  }
  throw std::logic_error("expected a rejection");
}

inline void Require(const db::Result& r) {
  if (!r) {
    throw std::runtime_error("fixture write failed: " + r.message);
  }
}

inline void InTx(db::Repository& repo, const std::function<void(db::Transaction&)>& fn) {
  auto tx = repo.Begin();
  fn(*tx);
  tx->Commit();
}

// Merchant owned by kOwner plus the customer's card and address.
inline void SeedAccounts(db::Repository& repo) {
  InTx(repo, [&](db::Transaction& tx) {
    Require(repo.InsertMerchant(tx, {kMerchant, kOwner, "Shear Joy", "hello@shearjoy.example"}));
    Require(repo.InsertMerchant(tx, {kMerchant + 1, kOwner + 1, "Other Salon", ""}));
    Require(repo.InsertInstrument(tx, {kCard, kCustomer}));
    Require(repo.InsertBillingAddress(tx, {kAddress, kCustomer}));
    Require(repo.InsertInstrument(tx, {kCard + 1, kOther}));
    Require(repo.InsertBillingAddress(tx, {kAddress + 1, kOther}));
  });
}

struct ServiceLine {
  int64_t  price_cents = 0;
  uint64_t staff_id    = 0;
};

inline uint64_t AddReservation(db::Repository& repo, uint64_t customer_id, uint64_t merchant_id,
                               std::initializer_list<ServiceLine> lines = {},
                               model::ReservationStatus status = model::ReservationStatus::kPending,
                               uint64_t end_offset_ms = 3'600'000) {
  db::model::ReservationRecord r;
  r.customer_id        = customer_id;
  r.merchant_id        = merchant_id;
  r.status             = status;
  r.created_at_ms      = util::NowMillis();
  r.scheduled_start_ms = r.created_at_ms + end_offset_ms - 1'800'000;
  r.scheduled_end_ms   = r.created_at_ms + end_offset_ms;

  InTx(repo, [&](db::Transaction& tx) {
    Require(repo.InsertReservation(tx, r));
    uint64_t service_id = 1;
    for (const auto& line : lines) {
      Require(repo.InsertReservationService(tx, {r.id, service_id++, line.staff_id, line.price_cents, 45}));
    }
  });
  return r.id;
}

// A visit that finished an hour ago and is waiting for the accrual sweep.
inline uint64_t AddCompletedVisit(db::Repository& repo, uint64_t customer_id, uint64_t merchant_id) {
  db::model::ReservationRecord r;
  r.customer_id        = customer_id;
  r.merchant_id        = merchant_id;
  r.status             = model::ReservationStatus::kCompleted;
  r.created_at_ms      = util::NowMillis() - 7'200'000;
  r.scheduled_start_ms = r.created_at_ms;
  r.scheduled_end_ms   = util::NowMillis() - 3'600'000;
  InTx(repo, [&](db::Transaction& tx) { Require(repo.InsertReservation(tx, r)); });
  return r.id;
}

inline uint64_t AddReward(db::Repository& repo, uint64_t customer_id, uint64_t merchant_id, int32_t pct) {
  db::model::RewardRecord reward;
  reward.customer_id   = customer_id;
  reward.merchant_id   = merchant_id;
  reward.discount_pct  = pct;
  reward.note          = "Thanks for visiting";
  reward.created_at_ms = util::NowMillis();
  InTx(repo, [&](db::Transaction& tx) { Require(repo.InsertReward(tx, reward)); });
  return reward.id;
}

inline uint64_t AddPromotion(db::Repository& repo, uint64_t customer_id, uint64_t merchant_id, const std::string& code,
                             int32_t bps, std::optional<uint64_t> expires_at_ms = std::nullopt) {
  db::model::PromotionRecord promo;
  promo.customer_id   = customer_id;
  promo.merchant_id   = merchant_id;
  promo.code          = code;
  promo.description   = "Spring special";
  promo.discount_bps  = bps;
  promo.issued_at_ms  = util::NowMillis() - 86'400'000;
  promo.expires_at_ms = expires_at_ms;
  InTx(repo, [&](db::Transaction& tx) { Require(repo.InsertPromotion(tx, promo)); });
  return promo.id;
}

inline void SetProgram(db::Repository& repo, uint64_t merchant_id, uint32_t target_visits, int32_t pct) {
  InTx(repo, [&](db::Transaction& tx) { Require(repo.UpsertProgram(tx, {merchant_id, target_visits, pct, "Free blowout", true})); });
}

inline std::optional<db::model::ReservationRecord> ReadReservation(db::Repository& repo, uint64_t id) {
  auto tx = repo.Begin();
  auto r  = repo.GetReservation(*tx, id);
  tx->Rollback();
  return r;
}

inline std::optional<db::model::RewardRecord> ReadReward(db::Repository& repo, uint64_t id) {
  auto tx = repo.Begin();
  auto r  = repo.GetReward(*tx, id);
  tx->Rollback();
  return r;
}

inline std::optional<db::model::PromotionRecord> ReadPromotion(db::Repository& repo, uint64_t id) {
  auto tx = repo.Begin();
  auto r  = repo.GetPromotion(*tx, id);
  tx->Rollback();
  return r;
}

inline std::vector<db::model::PaymentRecord> PaymentsFor(db::Repository& repo, uint64_t reservation_id) {
  auto tx = repo.Begin();
  auto r  = repo.ListPaymentsForReservation(*tx, reservation_id);
  tx->Rollback();
  return r;
}

inline std::optional<db::model::MembershipRecord> ReadMembership(db::Repository& repo, uint64_t customer_id, uint64_t merchant_id) {
  auto tx = repo.Begin();
  auto r  = repo.GetMembership(*tx, customer_id, merchant_id);
  tx->Rollback();
  return r;
}

} // namespace strands::testing
