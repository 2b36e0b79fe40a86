#include "promotion_issuer.hpp"

#include <exception>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/notify/notification.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/promo_code.hpp"
#include "internal/util/time.hpp"

namespace strands::core {

using util::RejectReason;

PromotionIssuer::PromotionIssuer(std::shared_ptr<db::Repository> repository, std::string default_sender_email,
                                 uint32_t default_min_total_visits, CodeGenerator generator)
    : repository_(std::move(repository)),
      resolver_(repository_),
      default_sender_email_(std::move(default_sender_email)),
      default_min_total_visits_(default_min_total_visits),
      generator_(std::move(generator)) {
  if (!generator_) {
    generator_ = [] { return util::GeneratePromoCode(); };
  }
}

PromotionIssuer::Terms PromotionIssuer::ValidateTerms(const std::string& description, const std::string& percentage,
                                                      std::optional<uint64_t> expires_at_ms, uint64_t now_ms) const {
  auto pct = util::ParseDecimal(percentage);
  if (!pct || *pct <= 0 || *pct > 100) {
    throw util::InvalidArgument(RejectReason::kInvalidDiscountPercentage, "Discount percentage must be greater than 0 and at most 100");
  }

  auto bps = util::PercentToBps(*pct);
  if (!bps || *bps <= 0 || *bps > util::kFullDiscountBps) {
    throw util::InvalidArgument(RejectReason::kInvalidDiscountPercentage, "Discount percentage must be greater than 0 and at most 100");
  }

  if (expires_at_ms && *expires_at_ms <= now_ms) {
    throw util::InvalidArgument(RejectReason::kInvalidExpiry, "Expiration date must be in the future");
  }

  return Terms{description, *bps, expires_at_ms};
}

db::model::MerchantRecord PromotionIssuer::RequireOwnedMerchant(db::Transaction& tx, uint64_t owner_user_id, uint64_t merchant_id) const {
  auto merchant = repository_->GetMerchant(tx, merchant_id);
  if (!merchant || merchant->owner_user_id != owner_user_id) {
    throw util::NotFound(RejectReason::kMerchantNotFound, "Merchant not found for this owner");
  }
  return *merchant;
}

IssuedPromotion PromotionIssuer::IssueWithin(db::Transaction& tx, const db::model::MerchantRecord& merchant, uint64_t customer_id,
                                             const Terms& terms, uint64_t now_ms) {
  db::model::PromotionRecord promo;
  promo.customer_id   = customer_id;
  promo.merchant_id   = merchant.id;
  promo.description   = terms.description;
  promo.discount_bps  = terms.bps;
  promo.status        = model::PromotionStatus::kIssued;
  promo.issued_at_ms  = now_ms;
  promo.expires_at_ms = terms.expires_at_ms;

  bool inserted = false;
  for (int attempt = 0; attempt < kPromoCodeAttempts && !inserted; ++attempt) {
    promo.code = generator_();
    if (repository_->PromotionCodeExists(tx, merchant.id, promo.code)) {
      continue;
    }

    auto r = repository_->InsertPromotion(tx, promo);
    if (r) {
      inserted = true;
    } else if (r.code != db::ErrorCode::AlreadyExists) {
      throw std::runtime_error("Failed to create promotion: " + r.message);
    }
  }
  if (!inserted) {
    throw util::ResourceExhausted(RejectReason::kPromoCodeSpaceExhausted, "Failed to generate a unique promo code");
  }

  notify::NotificationRequest note;
  note.recipient_id = customer_id;
  note.merchant_id  = merchant.id;
  note.category     = notify::NotificationCategory::kLoyaltyPromo;
  note.sender_email = merchant.sender_email.empty() ? default_sender_email_ : merchant.sender_email;
  note.promotion_id = promo.id;
  note.promo_code   = promo.code;
  note.message      = notify::LoyaltyPromoMessage(merchant.name, promo.code, util::FormatPercent(promo.discount_bps), promo.description,
                                                  promo.expires_at_ms);

  auto record = notify::ToRecord(note, now_ms);
  auto r      = repository_->InsertNotification(tx, record);
  if (!r) {
    throw std::runtime_error("Failed to create promotion notification: " + r.message);
  }

  return IssuedPromotion{promo, record.id};
}

IssuedPromotion PromotionIssuer::Issue(const IssuePromotionRequest& request) {
  if (request.merchant_id == 0 || request.customer_id == 0) {
    throw util::InvalidArgument(RejectReason::kMissingField, "Required fields: merchant_id, customer_id, discount_percentage");
  }

  const uint64_t now_ms = util::NowMillis();
  const auto     terms  = ValidateTerms(request.description, request.discount_percentage, request.expires_at_ms, now_ms);

  auto tx       = repository_->Begin();
  auto merchant = RequireOwnedMerchant(*tx, request.owner_user_id, request.merchant_id);

  if (repository_->CountReservations(*tx, request.customer_id, request.merchant_id) == 0) {
    throw util::NotFound(RejectReason::kCustomerNotEligible, "Customer has no appointments at this merchant");
  }

  auto issued = IssueWithin(*tx, merchant, request.customer_id, terms, now_ms);
  tx->Commit();

  STRANDS_LOG_INFO("promotion issued", {observability::UIntField("promotion_id", issued.promotion.id),
                                        observability::UIntField("merchant_id", request.merchant_id),
                                        observability::UIntField("customer_id", request.customer_id)});
  return issued;
}

LoyalCustomerIssueReport PromotionIssuer::IssueToLoyalCustomers(const LoyalCustomerIssueRequest& request) {
  if (request.merchant_id == 0) {
    throw util::InvalidArgument(RejectReason::kMissingField, "Required fields: merchant_id, discount_percentage");
  }

  const uint64_t now_ms     = util::NowMillis();
  const auto     terms      = ValidateTerms(request.description, request.discount_percentage, request.expires_at_ms, now_ms);
  const uint32_t min_visits = request.min_total_visits != 0 ? request.min_total_visits : default_min_total_visits_;

  db::model::MerchantRecord             merchant;
  std::vector<db::model::MembershipRecord> members;
  {
    auto tx  = repository_->Begin();
    merchant = RequireOwnedMerchant(*tx, request.owner_user_id, request.merchant_id);
    members  = repository_->ListMembershipsWithTotalVisits(*tx, request.merchant_id, min_visits);
    tx->Rollback();
  }

  LoyalCustomerIssueReport report;
  report.eligible = static_cast<uint32_t>(members.size());

  for (const auto& member : members) {
    try {
      auto tx = repository_->Begin();
      (void)IssueWithin(*tx, merchant, member.customer_id, terms, now_ms);
      tx->Commit();
      ++report.issued;
    } catch (const std::exception& e) {
      ++report.failed;
      STRANDS_LOG_WARN("loyal customer promotion failed", {observability::UIntField("merchant_id", request.merchant_id),
                                                           observability::UIntField("customer_id", member.customer_id),
                                                           observability::StringField("error", e.what())});
    }
  }

  STRANDS_LOG_INFO("loyal customer promotions issued", {observability::UIntField("merchant_id", request.merchant_id),
                                                        observability::UIntField("eligible", report.eligible),
                                                        observability::UIntField("issued", report.issued),
                                                        observability::UIntField("failed", report.failed)});
  return report;
}

std::vector<db::model::PromotionRecord> PromotionIssuer::List(uint64_t customer_id) {
  const uint64_t now_ms = util::NowMillis();

  auto tx     = repository_->Begin();
  auto promos = repository_->ListPromotions(*tx, customer_id);
  tx->Rollback();

  for (auto& promo : promos) {
    promo.status = model::EffectiveStatus(promo.status, promo.expires_at_ms, now_ms);
  }
  return promos;
}

PromotionPreview PromotionIssuer::Preview(uint64_t customer_id, std::string_view code, uint64_t reservation_id) {
  if (code.empty() || reservation_id == 0) {
    throw util::InvalidArgument(RejectReason::kMissingField, "Required fields: code, reservation_id");
  }

  const uint64_t now_ms = util::NowMillis();

  auto tx          = repository_->Begin();
  auto reservation = repository_->GetReservation(*tx, reservation_id);
  if (!reservation) {
    throw util::NotFound(RejectReason::kReservationNotFound, "Reservation not found");
  }
  if (reservation->customer_id != customer_id) {
    throw util::PermissionDenied(RejectReason::kReservationNotOwned, "Reservation does not belong to you");
  }

  PromotionPreview preview;
  preview.promotion = resolver_.ResolvePromotion(*tx, customer_id, reservation->merchant_id, code, now_ms);

  for (const auto& line : repository_->ListReservationServices(*tx, reservation_id)) {
    preview.original_total += line.price_cents;
  }
  tx->Rollback();

  preview.discounted_total = util::ApplyDiscount(preview.original_total, preview.promotion.discount_bps);
  preview.discount_amount  = preview.original_total - preview.discounted_total;
  return preview;
}

} // namespace strands::core
