#pragma once

#include <cstdint>

namespace strands::loyalty {

struct VisitStep {
  uint32_t visits_count = 0;
  bool     mint_reward  = false;
};

/*
  One completed visit against a program target.

  target_visits == 0 means the merchant has no active program: the visit
  is still counted but nothing is minted. Crossing the target mints one
  reward and keeps the overflow.
*/
constexpr VisitStep ApplyVisit(uint32_t visits_count, uint32_t target_visits) {
  const uint32_t next = visits_count + 1;
  if (target_visits == 0 || next < target_visits) {
    return {next, false};
  }
  return {next - target_visits, true};
}

} // namespace strands::loyalty
