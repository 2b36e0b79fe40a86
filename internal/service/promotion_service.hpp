#pragma once

#include <cstdint>

#include "service_context.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::service {

class PromotionService {
public:
  explicit PromotionService(ServiceContext ctx);

  strands::settlement::v1::IssuePromotionResponse
  IssuePromotion(uint64_t caller_id, const strands::settlement::v1::IssuePromotionRequest& req);

  strands::settlement::v1::IssueLoyalCustomerPromotionsResponse
  IssueLoyalCustomerPromotions(uint64_t caller_id, const strands::settlement::v1::IssueLoyalCustomerPromotionsRequest& req);

  strands::settlement::v1::ListPromotionsResponse
  ListPromotions(uint64_t caller_id, const strands::settlement::v1::ListPromotionsRequest& req);

  strands::settlement::v1::PreviewPromotionResponse
  PreviewPromotion(uint64_t caller_id, const strands::settlement::v1::PreviewPromotionRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace strands::service
