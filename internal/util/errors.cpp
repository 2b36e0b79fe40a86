#include "errors.hpp"

namespace strands::util {

std::string_view ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kUnspecified:
      return "UNSPECIFIED";
    case RejectReason::kMissingField:
      return "MISSING_FIELD";
    case RejectReason::kInvalidAmount:
      return "INVALID_AMOUNT";
    case RejectReason::kAmountTooSmall:
      return "AMOUNT_TOO_SMALL";
    case RejectReason::kTargetRequired:
      return "TARGET_REQUIRED";
    case RejectReason::kInvalidDiscountPercentage:
      return "INVALID_DISCOUNT_PERCENTAGE";
    case RejectReason::kInvalidExpiry:
      return "INVALID_EXPIRY";
    case RejectReason::kUnauthenticated:
      return "UNAUTHENTICATED";
    case RejectReason::kInstrumentNotFound:
      return "INSTRUMENT_NOT_FOUND";
    case RejectReason::kBillingAddressNotFound:
      return "BILLING_ADDRESS_NOT_FOUND";
    case RejectReason::kReservationNotFound:
      return "RESERVATION_NOT_FOUND";
    case RejectReason::kReservationNotOwned:
      return "RESERVATION_NOT_OWNED";
    case RejectReason::kReservationNotPending:
      return "RESERVATION_NOT_PENDING";
    case RejectReason::kBothDiscountsRequested:
      return "BOTH_DISCOUNTS_REQUESTED";
    case RejectReason::kRewardNotEligible:
      return "REWARD_NOT_ELIGIBLE";
    case RejectReason::kPromoRequiresReservation:
      return "PROMO_REQUIRES_RESERVATION";
    case RejectReason::kPromoNotFound:
      return "PROMO_NOT_FOUND";
    case RejectReason::kPromoExpired:
      return "PROMO_EXPIRED";
    case RejectReason::kRewardNoLongerAvailable:
      return "REWARD_NO_LONGER_AVAILABLE";
    case RejectReason::kPromoNoLongerAvailable:
      return "PROMO_NO_LONGER_AVAILABLE";
    case RejectReason::kReservationConflict:
      return "RESERVATION_CONFLICT";
    case RejectReason::kMerchantNotFound:
      return "MERCHANT_NOT_FOUND";
    case RejectReason::kCustomerNotEligible:
      return "CUSTOMER_NOT_ELIGIBLE";
    case RejectReason::kPromoCodeSpaceExhausted:
      return "PROMO_CODE_SPACE_EXHAUSTED";
  }
  return "UNSPECIFIED";
}

} // namespace strands::util
