#pragma once

#include <cstdint>
#include <string>

namespace strands::db::model {

// One per (customer, merchant). Only the accrual job writes it.
struct MembershipRecord {
  uint64_t customer_id        = 0;
  uint64_t merchant_id        = 0;
  uint32_t visits_count       = 0;
  uint32_t total_visits_count = 0;
};

// Per-merchant loyalty configuration; read-only for this service.
struct LoyaltyProgramRecord {
  uint64_t    merchant_id         = 0;
  uint32_t    target_visits       = 0;
  int32_t     discount_pct        = 0;
  std::string note;
  bool        active = true;
};

} // namespace strands::db::model
