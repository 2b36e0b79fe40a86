#include "notification.hpp"

#include "internal/util/time.hpp"

namespace strands::notify {

std::string_view ToString(NotificationCategory category) {
  switch (category) {
    case NotificationCategory::kRewardRedeemed:
      return "REWARD_REDEEMED";
    case NotificationCategory::kPromoRedeemed:
      return "PROMO_REDEEMED";
    case NotificationCategory::kBookingConfirmed:
      return "BOOKING_CONFIRMED";
    case NotificationCategory::kBookingConfirmedStaff:
      return "BOOKING_CONFIRMED_STAFF";
    case NotificationCategory::kRewardEarned:
      return "REWARD_EARNED";
    case NotificationCategory::kLoyaltyPromo:
      return "LOYALTY_PROMO";
  }
  return "UNKNOWN";
}

std::string TruncateMessage(std::string message) {
  if (message.size() <= kMaxMessageLength) {
    return message;
  }
  message.resize(kMaxMessageLength - 3);
  message += "...";
  return message;
}

db::model::NotificationRecord ToRecord(const NotificationRequest& request, uint64_t created_at_ms) {
  db::model::NotificationRecord r;
  r.recipient_id   = request.recipient_id;
  r.merchant_id    = request.merchant_id;
  r.sender_email   = request.sender_email;
  r.category       = std::string(ToString(request.category));
  r.message        = TruncateMessage(request.message);
  r.reservation_id = request.reservation_id;
  r.payment_id     = request.payment_id;
  r.promotion_id   = request.promotion_id;
  r.promo_code     = request.promo_code;
  r.created_at_ms  = created_at_ms;
  return r;
}

std::string BookingConfirmedMessage(uint64_t reservation_id, std::string_view amount) {
  return "Your appointment #" + std::to_string(reservation_id) + " is confirmed. Amount paid: $" + std::string(amount) + ".";
}

std::string StaffBookingMessage(uint64_t reservation_id) {
  return "New confirmed appointment #" + std::to_string(reservation_id) + " has been assigned to you.";
}

std::string RewardRedeemedMessage(std::string_view percent, std::string_view amount) {
  return "Your " + std::string(percent) + "% loyalty reward was applied. You paid $" + std::string(amount) + ".";
}

std::string PromoRedeemedMessage(std::string_view code, std::string_view percent, std::string_view amount) {
  return "Promo code " + std::string(code) + " was applied for " + std::string(percent) + "% off. You paid $" +
         std::string(amount) + ".";
}

std::string RewardEarnedMessage(int32_t discount_pct, std::string_view note) {
  std::string message = "You earned a " + std::to_string(discount_pct) + "% loyalty reward!";
  if (!note.empty()) {
    message += " " + std::string(note);
  }
  return message;
}

std::string LoyaltyPromoMessage(std::string_view merchant_name, std::string_view code, std::string_view percent,
                                std::string_view description, std::optional<uint64_t> expires_at_ms) {
  std::string message = "Thanks for being a loyal customer at " + std::string(merchant_name) + "! Use promo code " +
                        std::string(code) + " for " + std::string(percent) + "% off your next visit.";
  if (!description.empty()) {
    message += " " + std::string(description) + ".";
  }
  if (expires_at_ms.has_value()) {
    message += " Offer expires on " + util::FormatDate(*expires_at_ms) + ".";
  }
  return TruncateMessage(std::move(message));
}

} // namespace strands::notify
