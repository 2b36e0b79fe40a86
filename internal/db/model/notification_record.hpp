#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace strands::db::model {

// Inbox row. category holds the NotificationCategory name.
struct NotificationRecord {
  uint64_t id           = 0;
  uint64_t recipient_id = 0;
  uint64_t merchant_id  = 0;

  std::string sender_email;
  std::string category;
  std::string message;

  std::optional<uint64_t> reservation_id;
  std::optional<uint64_t> payment_id;
  std::optional<uint64_t> promotion_id;
  std::string             promo_code;

  uint64_t created_at_ms = 0;
};

} // namespace strands::db::model
