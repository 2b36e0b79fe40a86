#include "state_machine.hpp"

namespace strands::model {

std::string_view ToString(ReservationStatus status) {
  switch (status) {
    case ReservationStatus::kPending:
      return "PENDING";
    case ReservationStatus::kScheduled:
      return "SCHEDULED";
    case ReservationStatus::kCompleted:
      return "COMPLETED";
    case ReservationStatus::kCanceled:
      return "CANCELED";
  }
  return "UNKNOWN";
}

std::string_view ToString(LoyaltySeen seen) {
  switch (seen) {
    case LoyaltySeen::kUnprocessed:
      return "UNPROCESSED";
    case LoyaltySeen::kProcessed:
      return "PROCESSED";
    case LoyaltySeen::kCanceledProcessed:
      return "CANCELED_PROCESSED";
  }
  return "UNKNOWN";
}

std::string_view ToString(PromotionStatus status) {
  switch (status) {
    case PromotionStatus::kIssued:
      return "ISSUED";
    case PromotionStatus::kRedeemed:
      return "REDEEMED";
    case PromotionStatus::kExpired:
      return "EXPIRED";
  }
  return "UNKNOWN";
}

std::string_view ToString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kSucceeded:
      return "SUCCEEDED";
  }
  return "UNKNOWN";
}

std::optional<ReservationStatus> ParseReservationStatus(std::string_view text) {
  if (text == "PENDING") return ReservationStatus::kPending;
  if (text == "SCHEDULED") return ReservationStatus::kScheduled;
  if (text == "COMPLETED") return ReservationStatus::kCompleted;
  if (text == "CANCELED") return ReservationStatus::kCanceled;
  return std::nullopt;
}

std::optional<PromotionStatus> ParsePromotionStatus(std::string_view text) {
  if (text == "ISSUED") return PromotionStatus::kIssued;
  if (text == "REDEEMED") return PromotionStatus::kRedeemed;
  if (text == "EXPIRED") return PromotionStatus::kExpired;
  return std::nullopt;
}

} // namespace strands::model
