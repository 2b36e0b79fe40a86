#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace strands::db::memory {

using strands::model::LoyaltySeen;
using strands::model::PromotionStatus;
using strands::model::ReservationStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Merchants and accounts
// ------------------------------------------------------------------

Result MemoryRepository::InsertMerchant(Transaction& t, const model::MerchantRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.merchants.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "merchant exists");
  s.merchants[r.id] = r;
  return Result::Ok();
}

std::optional<model::MerchantRecord> MemoryRepository::GetMerchant(Transaction& t, uint64_t merchant_id) {
  const auto& s  = TX(t).View();
  auto        it = s.merchants.find(merchant_id);
  if (it == s.merchants.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertInstrument(Transaction& t, const model::InstrumentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.instruments.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "instrument exists");
  s.instruments[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertBillingAddress(Transaction& t, const model::BillingAddressRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.billing_addresses.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "billing address exists");
  s.billing_addresses[r.id] = r;
  return Result::Ok();
}

bool MemoryRepository::InstrumentBelongsTo(Transaction& t, uint64_t instrument_id, uint64_t user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.instruments.find(instrument_id);
  return it != s.instruments.end() && it->second.user_id == user_id;
}

bool MemoryRepository::BillingAddressBelongsTo(Transaction& t, uint64_t address_id, uint64_t user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.billing_addresses.find(address_id);
  return it != s.billing_addresses.end() && it->second.user_id == user_id;
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result MemoryRepository::InsertReservation(Transaction& t, model::ReservationRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_reservation_id;
  }
  if (s.reservations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "reservation exists");
  s.next_reservation_id = std::max(s.next_reservation_id, r.id + 1);
  s.reservations[r.id]  = r;
  return Result::Ok();
}

Result MemoryRepository::InsertReservationService(Transaction& t, const model::ReservationServiceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.reservations.contains(r.reservation_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown reservation");
  }
  s.reservation_services.push_back(r);
  return Result::Ok();
}

std::optional<model::ReservationRecord> MemoryRepository::GetReservation(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.reservations.find(id);
  if (it == s.reservations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ReservationServiceRecord> MemoryRepository::ListReservationServices(Transaction& t, uint64_t reservation_id) {
  std::vector<model::ReservationServiceRecord> out;
  for (const auto& line : TX(t).View().reservation_services) {
    if (line.reservation_id == reservation_id) out.push_back(line);
  }
  return out;
}

uint64_t MemoryRepository::CountReservations(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().reservations) {
    if (r.customer_id == customer_id && r.merchant_id == merchant_id) ++count;
  }
  return count;
}

CasResult MemoryRepository::TransitionReservation(Transaction& t, uint64_t id, ReservationStatus from, ReservationStatus to) {
  auto& s  = TX(t).Mutable();
  auto  it = s.reservations.find(id);
  if (it == s.reservations.end() || it->second.status != from) return CasResult::Missed();
  it->second.status = to;
  return CasResult::Swapped();
}

CasResult MemoryRepository::DeletePendingReservation(Transaction& t, uint64_t id, uint64_t customer_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.reservations.find(id);
  if (it == s.reservations.end() || it->second.customer_id != customer_id || it->second.status != ReservationStatus::kPending) {
    return CasResult::Missed();
  }
  s.reservations.erase(it);
  std::erase_if(s.reservation_services, [id](const auto& line) { return line.reservation_id == id; });
  return CasResult::Swapped();
}

// ------------------------------------------------------------------
// Loyalty bookkeeping
// ------------------------------------------------------------------

std::vector<model::ReservationRecord> MemoryRepository::ListAccrualCandidates(Transaction& t, uint64_t now_ms, std::size_t limit) {
  std::vector<model::ReservationRecord> out;
  for (const auto& [_, r] : TX(t).View().reservations) {
    if (limit != 0 && out.size() >= limit) break;
    if (r.status == ReservationStatus::kCompleted && r.loyalty_seen == LoyaltySeen::kUnprocessed && r.scheduled_end_ms < now_ms) {
      out.push_back(r);
    }
  }
  return out;
}

CasResult MemoryRepository::MarkLoyaltySeen(Transaction& t, uint64_t reservation_id, LoyaltySeen from, LoyaltySeen to) {
  auto& s  = TX(t).Mutable();
  auto  it = s.reservations.find(reservation_id);
  if (it == s.reservations.end() || it->second.loyalty_seen != from) return CasResult::Missed();
  it->second.loyalty_seen = to;
  return CasResult::Swapped();
}

Result MemoryRepository::MarkCanceledLoyaltySeen(Transaction& t, uint64_t& affected) {
  affected = 0;
  for (auto& [_, r] : TX(t).Mutable().reservations) {
    if (r.status == ReservationStatus::kCanceled && r.loyalty_seen == LoyaltySeen::kUnprocessed) {
      r.loyalty_seen = LoyaltySeen::kCanceledProcessed;
      ++affected;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.reservation_id.has_value() == r.order_id.has_value()) {
    return Result::Err(ErrorCode::ConstraintViolation, "payment must reference exactly one of reservation or order");
  }
  if (r.reward_id.has_value() && r.promotion_id.has_value()) {
    return Result::Err(ErrorCode::ConstraintViolation, "payment references both reward and promotion");
  }
  r.id              = s.next_payment_id++;
  s.payments[r.id]  = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.payments.find(id);
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PaymentRecord> MemoryRepository::ListPaymentsForReservation(Transaction& t, uint64_t reservation_id) {
  std::vector<model::PaymentRecord> out;
  for (const auto& [_, p] : TX(t).View().payments) {
    if (p.reservation_id == reservation_id) out.push_back(p);
  }
  return out;
}

// ------------------------------------------------------------------
// Rewards
// ------------------------------------------------------------------

Result MemoryRepository::InsertReward(Transaction& t, model::RewardRecord& r) {
  auto& s         = TX(t).Mutable();
  r.id            = s.next_reward_id++;
  s.rewards[r.id] = r;
  return Result::Ok();
}

std::optional<model::RewardRecord> MemoryRepository::GetReward(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.rewards.find(id);
  if (it == s.rewards.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RewardRecord> MemoryRepository::FindRedeemableReward(Transaction& t, uint64_t reward_id, uint64_t customer_id,
                                                                          uint64_t merchant_id) {
  auto reward = GetReward(t, reward_id);
  if (!reward || reward->customer_id != customer_id || reward->merchant_id != merchant_id ||
      reward->State() != strands::model::RewardState::kAvailable) {
    return std::nullopt;
  }
  return reward;
}

CasResult MemoryRepository::RedeemReward(Transaction& t, uint64_t reward_id, uint64_t customer_id, uint64_t merchant_id,
                                         uint64_t redeemed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.rewards.find(reward_id);
  if (it == s.rewards.end()) return CasResult::Missed();

  auto& r = it->second;
  if (r.customer_id != customer_id || r.merchant_id != merchant_id || r.State() != strands::model::RewardState::kAvailable) {
    return CasResult::Missed();
  }
  r.active         = false;
  r.redeemed_at_ms = redeemed_at_ms;
  return CasResult::Swapped();
}

std::vector<model::RewardRecord> MemoryRepository::ListRewards(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  std::vector<model::RewardRecord> out;
  for (const auto& [_, r] : TX(t).View().rewards) {
    if (r.customer_id == customer_id && r.merchant_id == merchant_id) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Promotions
// ------------------------------------------------------------------

Result MemoryRepository::InsertPromotion(Transaction& t, model::PromotionRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.promotions) {
    if (existing.customer_id == r.customer_id && existing.merchant_id == r.merchant_id && existing.code == r.code) {
      return Result::Err(ErrorCode::AlreadyExists, "promotion code already issued to customer");
    }
  }
  r.id               = s.next_promotion_id++;
  s.promotions[r.id] = r;
  return Result::Ok();
}

std::optional<model::PromotionRecord> MemoryRepository::GetPromotion(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.promotions.find(id);
  if (it == s.promotions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::PromotionRecord> MemoryRepository::FindIssuedPromotion(Transaction& t, const std::string& code, uint64_t customer_id,
                                                                            uint64_t merchant_id) {
  for (const auto& [_, p] : TX(t).View().promotions) {
    if (p.code == code && p.customer_id == customer_id && p.merchant_id == merchant_id && p.status == PromotionStatus::kIssued) {
      return p;
    }
  }
  return std::nullopt;
}

bool MemoryRepository::PromotionCodeExists(Transaction& t, uint64_t merchant_id, const std::string& code) {
  const auto& promotions = TX(t).View().promotions;
  return std::any_of(promotions.begin(), promotions.end(),
                     [&](const auto& entry) { return entry.second.merchant_id == merchant_id && entry.second.code == code; });
}

std::vector<model::PromotionRecord> MemoryRepository::ListPromotions(Transaction& t, uint64_t customer_id) {
  std::vector<model::PromotionRecord> out;
  for (const auto& [_, p] : TX(t).View().promotions) {
    if (p.customer_id == customer_id) out.push_back(p);
  }
  return out;
}

CasResult MemoryRepository::RedeemPromotion(Transaction& t, uint64_t promotion_id, uint64_t customer_id,
                                            const model::PromotionRedemption& redemption) {
  auto& s  = TX(t).Mutable();
  auto  it = s.promotions.find(promotion_id);
  if (it == s.promotions.end() || it->second.customer_id != customer_id || it->second.status != PromotionStatus::kIssued) {
    return CasResult::Missed();
  }
  auto& p                   = it->second;
  p.status                  = PromotionStatus::kRedeemed;
  p.redeemed_at_ms          = redemption.redeemed_at_ms;
  p.redeemed_reservation_id = redemption.reservation_id;
  p.redeemed_payment_id     = redemption.payment_id;
  return CasResult::Swapped();
}

Result MemoryRepository::ExpirePromotions(Transaction& t, uint64_t now_ms, uint64_t& affected) {
  affected = 0;
  for (auto& [_, p] : TX(t).Mutable().promotions) {
    if (p.status == PromotionStatus::kIssued && p.expires_at_ms.has_value() && *p.expires_at_ms <= now_ms) {
      p.status = PromotionStatus::kExpired;
      ++affected;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Memberships and programs
// ------------------------------------------------------------------

Result MemoryRepository::LockMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id, model::MembershipRecord& out) {
  // The transaction already holds the writer lock.
  auto& memberships = TX(t).Mutable().memberships;
  auto [it, _]      = memberships.try_emplace(MembershipKey{customer_id, merchant_id},
                                              model::MembershipRecord{.customer_id = customer_id, .merchant_id = merchant_id});
  out = it->second;
  return Result::Ok();
}

Result MemoryRepository::UpdateMembership(Transaction& t, const model::MembershipRecord& r) {
  auto& memberships = TX(t).Mutable().memberships;
  auto  it          = memberships.find(MembershipKey{r.customer_id, r.merchant_id});
  if (it == memberships.end()) return Result::Err(ErrorCode::NotFound, "membership not found");
  it->second = r;
  return Result::Ok();
}

std::optional<model::MembershipRecord> MemoryRepository::GetMembership(Transaction& t, uint64_t customer_id, uint64_t merchant_id) {
  const auto& memberships = TX(t).View().memberships;
  auto        it          = memberships.find(MembershipKey{customer_id, merchant_id});
  if (it == memberships.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MembershipRecord> MemoryRepository::ListMembershipsWithTotalVisits(Transaction& t, uint64_t merchant_id,
                                                                                      uint32_t min_total_visits) {
  std::vector<model::MembershipRecord> out;
  for (const auto& [key, m] : TX(t).View().memberships) {
    if (key.second == merchant_id && m.total_visits_count >= min_total_visits) out.push_back(m);
  }
  return out;
}

Result MemoryRepository::UpsertProgram(Transaction& t, const model::LoyaltyProgramRecord& r) {
  TX(t).Mutable().programs[r.merchant_id] = r;
  return Result::Ok();
}

std::optional<model::LoyaltyProgramRecord> MemoryRepository::FindActiveProgram(Transaction& t, uint64_t merchant_id) {
  const auto& programs = TX(t).View().programs;
  auto        it       = programs.find(merchant_id);
  if (it == programs.end() || !it->second.active) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result MemoryRepository::InsertNotification(Transaction& t, model::NotificationRecord& r) {
  auto& s               = TX(t).Mutable();
  r.id                  = s.next_notification_id++;
  s.notifications[r.id] = r;
  return Result::Ok();
}

std::vector<model::NotificationRecord> MemoryRepository::ListNotifications(Transaction& t, uint64_t recipient_id) {
  std::vector<model::NotificationRecord> out;
  for (const auto& [_, n] : TX(t).View().notifications) {
    if (n.recipient_id == recipient_id) out.push_back(n);
  }
  return out;
}

} // namespace strands::db::memory
