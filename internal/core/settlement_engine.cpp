#include "settlement_engine.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string_view>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace strands::core {

using util::RejectReason;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  throw std::runtime_error(result.message.empty() ? context : context + ": " + result.message);
}

util::Cents ValidateShape(const SettlementRequest& request) {
  if (request.customer_id == 0) {
    throw util::Unauthenticated("Unauthorized");
  }

  if (request.instrument_id == 0 || request.billing_address_id == 0 || request.amount.empty()) {
    throw util::InvalidArgument(RejectReason::kMissingField, "Required fields: instrument_id, billing_address_id, amount");
  }

  if (request.reservation_id.has_value() == request.order_id.has_value()) {
    throw util::InvalidArgument(RejectReason::kTargetRequired, "Exactly one of reservation_id or order_id must be provided");
  }

  auto value = util::ParseDecimal(request.amount);
  if (!value || *value <= 0) {
    throw util::InvalidArgument(RejectReason::kInvalidAmount, "Invalid amount. Must be a positive number");
  }

  auto cents = util::ToCents(*value);
  if (!cents) {
    throw util::InvalidArgument(RejectReason::kInvalidAmount, "Invalid amount. Must be a positive number");
  }
  if (*cents < util::kMinimumChargeCents) {
    throw util::InvalidArgument(RejectReason::kAmountTooSmall, "Amount must be at least 0.01");
  }
  return *cents;
}

std::string_view RequestedDiscount(const SettlementRequest& request) {
  if (request.discount.reward_id) return ToString(DiscountKind::kLoyalty);
  if (request.discount.promo_code) return ToString(DiscountKind::kPromo);
  return ToString(DiscountKind::kNone);
}

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSink> sink,
                                   std::string default_sender_email)
    : repository_(std::move(repository)),
      sink_(std::move(sink)),
      resolver_(repository_),
      releaser_(repository_),
      default_sender_email_(std::move(default_sender_email)) {
  if (!sink_) {
    throw std::invalid_argument("SettlementEngine requires a notification sink");
  }
}

SettlementResult SettlementEngine::Settle(const SettlementRequest& request) {
  const auto requested_cents = ValidateShape(request);

  std::optional<uint64_t>                     release_reservation_id;
  std::optional<db::model::ReservationRecord> reservation;
  SettlementResult                            result;

  try {
    auto tx = repository_->Begin();
    result  = SettleInTransaction(*tx, request, requested_cents, release_reservation_id, reservation);
    tx->Commit();
  } catch (const std::exception& e) {
    // The transaction above is already rolled back by the time we get here.
    const auto* domain = dynamic_cast<const util::Error*>(&e);
    const auto  reason = domain ? util::ToString(domain->Reason()) : std::string_view("INTERNAL");
    STRANDS_LOG_WARN("settlement rejected", {observability::UIntField("customer_id", request.customer_id),
                                             observability::StringField("reason", reason), observability::StringField("error", e.what())});
    observability::Metrics::Instance().RecordSettlement(reason, RequestedDiscount(request));

    if (release_reservation_id) {
      (void)releaser_.Release(*release_reservation_id, request.customer_id, e.what());
    }
    throw;
  }

  STRANDS_LOG_INFO("settlement committed", {observability::UIntField("payment_id", result.payment_id),
                                            observability::UIntField("customer_id", request.customer_id),
                                            observability::StringField("amount", util::FormatCents(result.amount_cents)),
                                            observability::StringField("discount", ToString(result.discount_kind))});
  observability::Metrics::Instance().RecordSettlement("settled", ToString(result.discount_kind));

  notify::EmitBestEffort(*sink_, CollectNotifications(request, reservation, result));
  return result;
}

std::vector<notify::NotificationRequest> SettlementEngine::CollectNotifications(
    const SettlementRequest& request, const std::optional<db::model::ReservationRecord>& reservation, const SettlementResult& result) {
  const uint64_t merchant_id = reservation ? reservation->merchant_id : request.merchant_id;
  try {
    auto tx  = repository_->Begin();
    auto out = BuildNotifications(*tx, request, reservation ? &*reservation : nullptr, merchant_id, result);
    tx->Rollback();
    return out;
  } catch (const std::exception& e) {
    STRANDS_LOG_ERROR("settlement notifications not built", {observability::UIntField("payment_id", result.payment_id),
                                                             observability::StringField("error", e.what())});
    return {};
  }
}

SettlementResult SettlementEngine::SettleInTransaction(db::Transaction& tx, const SettlementRequest& request,
                                                       util::Cents requested_cents, std::optional<uint64_t>& release_reservation_id,
                                                       std::optional<db::model::ReservationRecord>& settled_reservation) {
  const uint64_t now_ms = util::NowMillis();

  // From here on a failure frees the slot, unless the reservation itself is the problem.
  release_reservation_id = request.reservation_id;

  if (!repository_->InstrumentBelongsTo(tx, request.instrument_id, request.customer_id)) {
    throw util::NotFound(RejectReason::kInstrumentNotFound, "Payment instrument not found or does not belong to you");
  }

  if (!repository_->BillingAddressBelongsTo(tx, request.billing_address_id, request.customer_id)) {
    throw util::NotFound(RejectReason::kBillingAddressNotFound, "Billing address not found or does not belong to you");
  }

  std::optional<db::model::ReservationRecord> reservation;
  if (request.reservation_id) {
    reservation = repository_->GetReservation(tx, *request.reservation_id);
    if (!reservation) {
      release_reservation_id.reset();
      throw util::NotFound(RejectReason::kReservationNotFound, "Reservation not found");
    }
    if (reservation->customer_id != request.customer_id) {
      release_reservation_id.reset();
      throw util::PermissionDenied(RejectReason::kReservationNotOwned, "Reservation does not belong to you");
    }
    if (reservation->status != model::ReservationStatus::kPending) {
      release_reservation_id.reset();
      throw util::InvalidState(RejectReason::kReservationNotPending,
                               "Cannot process payment for reservation with status '" +
                                   std::string(model::ToString(reservation->status)) + "'. Reservation must be in PENDING status.");
    }
  }

  const auto* reservation_ptr = reservation ? &*reservation : nullptr;
  const auto  discount = resolver_.Resolve(tx, request.customer_id, reservation_ptr, request.merchant_id, request.discount, now_ms);

  const util::Cents final_cents = discount.Applies() ? util::ApplyDiscount(requested_cents, discount.bps) : requested_cents;
  if (final_cents < util::kMinimumChargeCents) {
    throw util::InvalidArgument(RejectReason::kAmountTooSmall, "Discounted amount must be at least 0.01");
  }

  // (a) payment row
  db::model::PaymentRecord payment;
  payment.customer_id        = request.customer_id;
  payment.reservation_id     = request.reservation_id;
  payment.order_id           = request.order_id;
  payment.instrument_id      = request.instrument_id;
  payment.billing_address_id = request.billing_address_id;
  payment.amount_cents       = final_cents;
  payment.created_at_ms      = now_ms;
  if (discount.kind == DiscountKind::kLoyalty) payment.reward_id = discount.source_id;
  if (discount.kind == DiscountKind::kPromo) payment.promotion_id = discount.source_id;

  ThrowIfDbError(repository_->InsertPayment(tx, payment), "Failed to process payment");

  const uint64_t merchant_id = reservation ? reservation->merchant_id : request.merchant_id;

  // (b) reward
  if (discount.kind == DiscountKind::kLoyalty) {
    auto cas = repository_->RedeemReward(tx, discount.source_id, request.customer_id, merchant_id, now_ms);
    ThrowIfDbError(cas.status, "Failed to redeem reward");
    if (!cas.swapped) {
      throw util::Conflict(RejectReason::kRewardNoLongerAvailable, "Reward is no longer available");
    }
  }

  // (c) promotion
  if (discount.kind == DiscountKind::kPromo) {
    db::model::PromotionRedemption redemption;
    redemption.redeemed_at_ms = now_ms;
    redemption.reservation_id = reservation->id;
    redemption.payment_id     = payment.id;

    auto cas = repository_->RedeemPromotion(tx, discount.source_id, request.customer_id, redemption);
    ThrowIfDbError(cas.status, "Failed to redeem promo code");
    if (!cas.swapped) {
      throw util::Conflict(RejectReason::kPromoNoLongerAvailable, "Promo code is no longer available");
    }
  }

  // (d) reservation
  bool booking_updated = false;
  if (reservation) {
    const auto to = model::Next(model::ReservationStatus::kPending, model::ReservationEvent::kPaymentSettled);
    auto       cas = repository_->TransitionReservation(tx, reservation->id, model::ReservationStatus::kPending, *to);
    ThrowIfDbError(cas.status, "Failed to update reservation status");
    if (!cas.swapped) {
      // someone else moved the row; it is not ours to free
      release_reservation_id.reset();
      throw util::Conflict(RejectReason::kReservationConflict, "Reservation was modified by another request");
    }
    booking_updated = true;
  }

  SettlementResult result;
  result.payment_id      = payment.id;
  result.amount_cents    = final_cents;
  result.discount_kind   = discount.kind;
  result.discount_bps    = discount.bps;
  result.booking_updated = booking_updated;
  if (discount.Applies()) {
    result.original_amount_cents = requested_cents;
  }
  if (discount.kind == DiscountKind::kLoyalty) result.reward_id = discount.source_id;
  if (discount.kind == DiscountKind::kPromo) result.promotion_id = discount.source_id;

  settled_reservation = std::move(reservation);
  return result;
}

std::vector<notify::NotificationRequest> SettlementEngine::BuildNotifications(db::Transaction& tx, const SettlementRequest& request,
                                                                              const db::model::ReservationRecord* reservation,
                                                                              uint64_t merchant_id, const SettlementResult& result) {
  std::string sender = default_sender_email_;
  if (merchant_id != 0) {
    auto merchant = repository_->GetMerchant(tx, merchant_id);
    if (merchant && !merchant->sender_email.empty()) {
      sender = merchant->sender_email;
    }
  }

  const auto amount  = util::FormatCents(result.amount_cents);
  const auto percent = util::FormatPercent(result.discount_bps);

  auto base = [&](uint64_t recipient, notify::NotificationCategory category, std::string message) {
    notify::NotificationRequest n;
    n.recipient_id = recipient;
    n.merchant_id  = merchant_id;
    n.category     = category;
    n.message      = std::move(message);
    n.sender_email = sender;
    n.payment_id   = result.payment_id;
    if (reservation) n.reservation_id = reservation->id;
    return n;
  };

  std::vector<notify::NotificationRequest> out;

  if (result.discount_kind == DiscountKind::kLoyalty) {
    out.push_back(base(request.customer_id, notify::NotificationCategory::kRewardRedeemed, notify::RewardRedeemedMessage(percent, amount)));
  }

  if (result.discount_kind == DiscountKind::kPromo) {
    auto promo = repository_->GetPromotion(tx, *result.promotion_id);
    auto code  = promo ? promo->code : std::string();
    auto n     = base(request.customer_id, notify::NotificationCategory::kPromoRedeemed, notify::PromoRedeemedMessage(code, percent, amount));
    n.promotion_id = result.promotion_id;
    n.promo_code   = code;
    out.push_back(std::move(n));
  }

  if (reservation) {
    out.push_back(base(request.customer_id, notify::NotificationCategory::kBookingConfirmed,
                       notify::BookingConfirmedMessage(reservation->id, amount)));

    std::vector<uint64_t> staff;
    for (const auto& line : repository_->ListReservationServices(tx, reservation->id)) {
      if (line.staff_id != 0 && std::find(staff.begin(), staff.end(), line.staff_id) == staff.end()) {
        staff.push_back(line.staff_id);
      }
    }
    for (auto staff_id : staff) {
      out.push_back(base(staff_id, notify::NotificationCategory::kBookingConfirmedStaff, notify::StaffBookingMessage(reservation->id)));
    }
  }

  return out;
}

} // namespace strands::core
