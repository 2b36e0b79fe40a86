#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/notification_record.hpp"

namespace strands::notify {

enum class NotificationCategory {
  kRewardRedeemed,
  kPromoRedeemed,
  kBookingConfirmed,
  kBookingConfirmedStaff,
  kRewardEarned,
  kLoyaltyPromo,
};

std::string_view ToString(NotificationCategory category);

inline constexpr std::size_t kMaxMessageLength = 400;

/*
  One message for one recipient. The delivery component owns retries;
  this side only hands the request over.
*/
struct NotificationRequest {
  uint64_t             recipient_id = 0;
  uint64_t             merchant_id  = 0;
  NotificationCategory category     = NotificationCategory::kBookingConfirmed;
  std::string          message;
  std::string          sender_email;

  std::optional<uint64_t> reservation_id;
  std::optional<uint64_t> payment_id;
  std::optional<uint64_t> promotion_id;
  std::string             promo_code;
};

// Cuts to kMaxMessageLength, ending in "..." when anything was dropped.
std::string TruncateMessage(std::string message);

db::model::NotificationRecord ToRecord(const NotificationRequest& request, uint64_t created_at_ms);

// ------------------------------------------------------------------
// Message texts
// ------------------------------------------------------------------

std::string BookingConfirmedMessage(uint64_t reservation_id, std::string_view amount);
std::string StaffBookingMessage(uint64_t reservation_id);
std::string RewardRedeemedMessage(std::string_view percent, std::string_view amount);
std::string PromoRedeemedMessage(std::string_view code, std::string_view percent, std::string_view amount);
std::string RewardEarnedMessage(int32_t discount_pct, std::string_view note);

std::string LoyaltyPromoMessage(std::string_view merchant_name, std::string_view code, std::string_view percent,
                                std::string_view description, std::optional<uint64_t> expires_at_ms);

} // namespace strands::notify
