#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace strands::model {

// ------------------------------------------------------------------
// Reservation
// ------------------------------------------------------------------

enum class ReservationStatus : std::uint8_t {
  kPending   = 0,
  kScheduled = 1,
  kCompleted = 2,
  kCanceled  = 3,
};

enum class ReservationEvent : std::uint8_t {
  kPaymentSettled = 0,
  kVisitElapsed   = 1,
  kCancel         = 2,
};

constexpr std::optional<ReservationStatus> Next(ReservationStatus from, ReservationEvent event) {
  switch (from) {
    case ReservationStatus::kPending:
      if (event == ReservationEvent::kPaymentSettled) return ReservationStatus::kScheduled;
      if (event == ReservationEvent::kCancel) return ReservationStatus::kCanceled;
      return std::nullopt;
    case ReservationStatus::kScheduled:
      if (event == ReservationEvent::kVisitElapsed) return ReservationStatus::kCompleted;
      if (event == ReservationEvent::kCancel) return ReservationStatus::kCanceled;
      return std::nullopt;
    case ReservationStatus::kCompleted:
    case ReservationStatus::kCanceled:
      return std::nullopt;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Loyalty bookkeeping on a reservation
// ------------------------------------------------------------------

/*
  Stored as 0/1/2. A reservation leaves kUnprocessed exactly once,
  and only once its status is terminal.
*/
enum class LoyaltySeen : std::uint8_t {
  kUnprocessed       = 0,
  kProcessed         = 1,
  kCanceledProcessed = 2,
};

constexpr std::optional<LoyaltySeen> Next(LoyaltySeen from, ReservationStatus status) {
  if (from != LoyaltySeen::kUnprocessed) {
    return std::nullopt;
  }
  if (status == ReservationStatus::kCompleted) return LoyaltySeen::kProcessed;
  if (status == ReservationStatus::kCanceled) return LoyaltySeen::kCanceledProcessed;
  return std::nullopt;
}

// ------------------------------------------------------------------
// Promotion
// ------------------------------------------------------------------

enum class PromotionStatus : std::uint8_t {
  kIssued   = 0,
  kRedeemed = 1,
  kExpired  = 2,
};

enum class PromotionEvent : std::uint8_t {
  kRedeem = 0,
  kExpire = 1,
};

constexpr std::optional<PromotionStatus> Next(PromotionStatus from, PromotionEvent event) {
  if (from != PromotionStatus::kIssued) {
    return std::nullopt;
  }
  return event == PromotionEvent::kRedeem ? PromotionStatus::kRedeemed : PromotionStatus::kExpired;
}

// Expiry is judged at read time; the stored status may lag behind.
constexpr PromotionStatus EffectiveStatus(PromotionStatus stored, std::optional<std::uint64_t> expires_at_ms,
                                          std::uint64_t now_ms) {
  if (stored == PromotionStatus::kIssued && expires_at_ms.has_value() && *expires_at_ms <= now_ms) {
    return PromotionStatus::kExpired;
  }
  return stored;
}

// ------------------------------------------------------------------
// Reward
// ------------------------------------------------------------------

enum class RewardState : std::uint8_t {
  kAvailable = 0,
  kRedeemed  = 1,
};

constexpr std::optional<RewardState> Redeem(RewardState from) {
  if (from != RewardState::kAvailable) {
    return std::nullopt;
  }
  return RewardState::kRedeemed;
}

// ------------------------------------------------------------------
// Payment
// ------------------------------------------------------------------

// A payment row only exists once money has settled.
enum class PaymentStatus : std::uint8_t {
  kSucceeded = 0,
};

std::string_view ToString(ReservationStatus status);
std::string_view ToString(LoyaltySeen seen);
std::string_view ToString(PromotionStatus status);
std::string_view ToString(PaymentStatus status);

std::optional<ReservationStatus> ParseReservationStatus(std::string_view text);
std::optional<PromotionStatus>   ParsePromotionStatus(std::string_view text);

} // namespace strands::model
