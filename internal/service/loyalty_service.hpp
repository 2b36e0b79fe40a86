#pragma once

#include <cstdint>

#include "service_context.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::service {

class LoyaltyService {
public:
  explicit LoyaltyService(ServiceContext ctx);

  strands::settlement::v1::ListRewardsResponse
  ListRewards(uint64_t caller_id, const strands::settlement::v1::ListRewardsRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace strands::service
