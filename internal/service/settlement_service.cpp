#include "settlement_service.hpp"

#include "internal/core/settlement_engine.hpp"
#include "internal/util/money.hpp"
#include "observe_rpc.hpp"

namespace strands::service {

using namespace strands::settlement::v1;

namespace {

DiscountType ToProto(core::DiscountKind kind) {
  switch (kind) {
    case core::DiscountKind::kNone:
      return DISCOUNT_TYPE_NONE;
    case core::DiscountKind::kLoyalty:
      return DISCOUNT_TYPE_LOYALTY;
    case core::DiscountKind::kPromo:
      return DISCOUNT_TYPE_PROMO;
  }
  return DISCOUNT_TYPE_UNSPECIFIED;
}

core::SettlementRequest FromProto(uint64_t caller_id, const SettlePaymentRequest& req) {
  core::SettlementRequest out;
  out.customer_id        = caller_id;
  out.instrument_id      = req.instrument_id();
  out.billing_address_id = req.billing_address_id();
  out.amount             = req.amount();
  out.merchant_id        = req.merchant_id();

  if (req.target_case() == SettlePaymentRequest::kReservationId) {
    out.reservation_id = req.reservation_id();
  } else if (req.target_case() == SettlePaymentRequest::kOrderId) {
    out.order_id = req.order_id();
  }

  if (req.reward_id() != 0) {
    out.discount.reward_id = req.reward_id();
  }
  if (!req.promo_code().empty()) {
    out.discount.promo_code = req.promo_code();
  }
  return out;
}

} // namespace

SettlementService::SettlementService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SettlePaymentResponse SettlementService::SettlePayment(uint64_t caller_id, const SettlePaymentRequest& req) {
  return ObserveRpc("SettlementService.SettlePayment", caller_id, [&] {
    RequireCaller(caller_id);

    const auto result = ctx_.settlement->Settle(FromProto(caller_id, req));

    SettlePaymentResponse resp;
    resp.set_payment_id(result.payment_id);
    resp.set_amount(util::FormatCents(result.amount_cents));
    if (result.original_amount_cents) {
      resp.set_original_amount(util::FormatCents(*result.original_amount_cents));
    }
    resp.set_discount_type(ToProto(result.discount_kind));
    if (result.discount_kind != core::DiscountKind::kNone) {
      resp.set_discount_percentage(util::FormatPercent(result.discount_bps));
    }
    if (result.reward_id) resp.set_reward_id(*result.reward_id);
    if (result.promotion_id) resp.set_promotion_id(*result.promotion_id);
    resp.set_booking_updated(result.booking_updated);
    return resp;
  });
}

} // namespace strands::service
