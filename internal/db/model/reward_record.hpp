#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace strands::db::model {

struct RewardRecord {
  uint64_t id          = 0;
  uint64_t customer_id = 0;
  uint64_t merchant_id = 0;

  // whole percent, as configured on the loyalty program
  int32_t     discount_pct = 0;
  std::string note;

  bool                    active = true;
  std::optional<uint64_t> redeemed_at_ms;

  uint64_t created_at_ms = 0;

  strands::model::RewardState State() const {
    return active && !redeemed_at_ms.has_value() ? strands::model::RewardState::kAvailable
                                                 : strands::model::RewardState::kRedeemed;
  }
};

} // namespace strands::db::model
