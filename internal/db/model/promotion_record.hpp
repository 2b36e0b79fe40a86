#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace strands::db::model {

/*
  Customer-targeted promotion code.

  (customer_id, merchant_id, code) is unique. discount_bps holds the
  two-decimal percentage in basis points.
*/
struct PromotionRecord {
  uint64_t id          = 0;
  uint64_t customer_id = 0;
  uint64_t merchant_id = 0;

  std::string code;
  std::string description;
  int32_t     discount_bps = 0;

  strands::model::PromotionStatus status = strands::model::PromotionStatus::kIssued;

  uint64_t                issued_at_ms = 0;
  std::optional<uint64_t> expires_at_ms;

  std::optional<uint64_t> redeemed_at_ms;
  std::optional<uint64_t> redeemed_reservation_id;
  std::optional<uint64_t> redeemed_payment_id;
};

// Stamped onto a promotion when it is redeemed.
struct PromotionRedemption {
  uint64_t redeemed_at_ms = 0;
  uint64_t reservation_id = 0;
  uint64_t payment_id     = 0;
};

} // namespace strands::db::model
