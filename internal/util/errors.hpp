#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace strands::util {

/*
  Machine-readable rejection reasons.

  Every domain exception carries one. The transport layer copies the
  reason name into the status details so callers can branch on it
  without parsing messages.
*/
enum class RejectReason {
  kUnspecified = 0,

  // request validation
  kMissingField,
  kInvalidAmount,
  kAmountTooSmall,
  kTargetRequired,
  kInvalidDiscountPercentage,
  kInvalidExpiry,

  // identity and ownership
  kUnauthenticated,
  kInstrumentNotFound,
  kBillingAddressNotFound,
  kReservationNotFound,
  kReservationNotOwned,
  kReservationNotPending,

  // discount resolution
  kBothDiscountsRequested,
  kRewardNotEligible,
  kPromoRequiresReservation,
  kPromoNotFound,
  kPromoExpired,

  // lost optimistic-concurrency races
  kRewardNoLongerAvailable,
  kPromoNoLongerAvailable,
  kReservationConflict,

  // promotion issuance
  kMerchantNotFound,
  kCustomerNotEligible,
  kPromoCodeSpaceExhausted,
};

std::string_view ToString(RejectReason reason);

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class Error : public std::runtime_error {
 public:
  Error(RejectReason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  RejectReason Reason() const {
    return reason_;
  }

 private:
  RejectReason reason_;
};

class InvalidArgument : public Error {
 public:
  InvalidArgument(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

class Unauthenticated : public Error {
 public:
  explicit Unauthenticated(const std::string& msg) : Error(RejectReason::kUnauthenticated, msg) {
  }
};

class PermissionDenied : public Error {
 public:
  PermissionDenied(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

class NotFound : public Error {
 public:
  NotFound(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

class InvalidState : public Error {
 public:
  InvalidState(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

class Conflict : public Error {
 public:
  Conflict(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

class ResourceExhausted : public Error {
 public:
  ResourceExhausted(RejectReason reason, const std::string& msg) : Error(reason, msg) {
  }
};

} // namespace strands::util
