#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/state_machine.hpp"

namespace strands::db::model {

/*
  Immutable settlement row. Exactly one of reservation_id / order_id
  is set, and at most one of reward_id / promotion_id.
*/
struct PaymentRecord {
  uint64_t id          = 0;
  uint64_t customer_id = 0;

  std::optional<uint64_t> reservation_id;
  std::optional<uint64_t> order_id;

  uint64_t instrument_id      = 0;
  uint64_t billing_address_id = 0;

  std::optional<uint64_t> reward_id;
  std::optional<uint64_t> promotion_id;

  int64_t amount_cents = 0;

  strands::model::PaymentStatus status = strands::model::PaymentStatus::kSucceeded;

  uint64_t created_at_ms = 0;
};

} // namespace strands::db::model
