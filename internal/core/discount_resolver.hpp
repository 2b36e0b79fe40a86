#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/util/money.hpp"

namespace strands::core {

enum class DiscountKind {
  kNone,
  kLoyalty,
  kPromo,
};

std::string_view ToString(DiscountKind kind);

// What the payer asked for. An empty promo code counts as absent.
struct DiscountRequest {
  std::optional<uint64_t> reward_id;
  std::optional<std::string> promo_code;
};

struct ResolvedDiscount {
  DiscountKind      kind      = DiscountKind::kNone;
  util::BasisPoints bps       = 0;
  uint64_t          source_id = 0; // reward or promotion id
  std::string       promo_code;

  bool Applies() const {
    return kind != DiscountKind::kNone;
  }
};

/*
  DiscountResolver

  Validates a requested reward or promotion code for one payer and
  returns the discount to apply. Reads only; redemption happens later
  in the settlement transaction through a conditional update.

  Rejections are thrown as util::Error subclasses:
    BOTH_DISCOUNTS_REQUESTED   both a reward and a code
    REWARD_NOT_ELIGIBLE        no active, unredeemed reward in scope
    PROMO_REQUIRES_RESERVATION code on an order purchase
    PROMO_NOT_FOUND            no ISSUED code for (customer, merchant)
    PROMO_EXPIRED              ISSUED but past its expiry
*/
class DiscountResolver {
 public:
  explicit DiscountResolver(std::shared_ptr<db::Repository> repository);

  /*
    reservation is null for an order purchase; order_merchant_id is
    then the only merchant scope for a reward (0 when unknown).
  */
  ResolvedDiscount Resolve(db::Transaction& tx, uint64_t customer_id, const db::model::ReservationRecord* reservation,
                           uint64_t order_merchant_id, const DiscountRequest& request, uint64_t now_ms) const;

  // Code lookup shared with promotion preview.
  db::model::PromotionRecord ResolvePromotion(db::Transaction& tx, uint64_t customer_id, uint64_t merchant_id,
                                              std::string_view code, uint64_t now_ms) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace strands::core
