#include "discount_resolver.hpp"

#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/promo_code.hpp"

namespace strands::core {

using util::RejectReason;

std::string_view ToString(DiscountKind kind) {
  switch (kind) {
    case DiscountKind::kNone:
      return "none";
    case DiscountKind::kLoyalty:
      return "loyalty";
    case DiscountKind::kPromo:
      return "promo";
  }
  return "none";
}

DiscountResolver::DiscountResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("DiscountResolver requires a repository");
  }
}

ResolvedDiscount DiscountResolver::Resolve(db::Transaction& tx, uint64_t customer_id, const db::model::ReservationRecord* reservation,
                                           uint64_t order_merchant_id, const DiscountRequest& request, uint64_t now_ms) const {
  const bool wants_reward = request.reward_id.has_value();
  const bool wants_promo  = request.promo_code.has_value() && !request.promo_code->empty();

  if (wants_reward && wants_promo) {
    throw util::InvalidArgument(RejectReason::kBothDiscountsRequested, "Cannot apply both a loyalty reward and a promo code");
  }

  if (wants_reward) {
    const uint64_t merchant_id = reservation ? reservation->merchant_id : order_merchant_id;
    if (merchant_id == 0) {
      throw util::NotFound(RejectReason::kRewardNotEligible, "Reward not found or not eligible");
    }

    auto reward = repository_->FindRedeemableReward(tx, *request.reward_id, customer_id, merchant_id);
    if (!reward || reward->State() != model::RewardState::kAvailable) {
      throw util::NotFound(RejectReason::kRewardNotEligible, "Reward not found or not eligible");
    }

    ResolvedDiscount out;
    out.kind      = DiscountKind::kLoyalty;
    out.bps       = static_cast<util::BasisPoints>(reward->discount_pct * 100);
    out.source_id = reward->id;
    return out;
  }

  if (wants_promo) {
    if (!reservation) {
      throw util::InvalidArgument(RejectReason::kPromoRequiresReservation, "Promo codes can only be applied to appointments");
    }

    auto promo = ResolvePromotion(tx, customer_id, reservation->merchant_id, *request.promo_code, now_ms);

    ResolvedDiscount out;
    out.kind       = DiscountKind::kPromo;
    out.bps        = promo.discount_bps;
    out.source_id  = promo.id;
    out.promo_code = promo.code;
    return out;
  }

  return {};
}

db::model::PromotionRecord DiscountResolver::ResolvePromotion(db::Transaction& tx, uint64_t customer_id, uint64_t merchant_id,
                                                              std::string_view code, uint64_t now_ms) const {
  const auto normalized = util::NormalizePromoCode(code);

  auto promo = repository_->FindIssuedPromotion(tx, normalized, customer_id, merchant_id);
  if (!promo) {
    throw util::NotFound(RejectReason::kPromoNotFound, "Promo code not found or not valid for this appointment");
  }

  if (model::EffectiveStatus(promo->status, promo->expires_at_ms, now_ms) == model::PromotionStatus::kExpired) {
    throw util::InvalidState(RejectReason::kPromoExpired, "Promo code has expired");
  }
  return *promo;
}

} // namespace strands::core
