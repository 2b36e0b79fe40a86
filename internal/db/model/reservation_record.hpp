#pragma once

#include <cstdint>

#include "internal/model/state_machine.hpp"

namespace strands::db::model {

/*
  Persistent booking row.

  IMPORTANT:
  - Created PENDING by the booking flow; settlement only confirms or
    releases it.
  - status and loyalty_seen only move through conditional updates.
*/
struct ReservationRecord {
  uint64_t id          = 0;
  uint64_t customer_id = 0;
  uint64_t merchant_id = 0;

  uint64_t scheduled_start_ms = 0;
  uint64_t scheduled_end_ms   = 0;

  strands::model::ReservationStatus status       = strands::model::ReservationStatus::kPending;
  strands::model::LoyaltySeen       loyalty_seen = strands::model::LoyaltySeen::kUnprocessed;

  uint64_t created_at_ms = 0;
};

// One booked service line. staff_id is 0 when nobody is assigned.
struct ReservationServiceRecord {
  uint64_t reservation_id   = 0;
  uint64_t service_id       = 0;
  uint64_t staff_id         = 0;
  int64_t  price_cents      = 0;
  uint32_t duration_minutes = 0;
};

} // namespace strands::db::model
