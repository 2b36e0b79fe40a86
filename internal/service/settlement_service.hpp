#pragma once

#include <cstdint>

#include "service_context.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::service {

class SettlementService {
public:
  explicit SettlementService(ServiceContext ctx);

  strands::settlement::v1::SettlePaymentResponse
  SettlePayment(uint64_t caller_id, const strands::settlement::v1::SettlePaymentRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace strands::service
