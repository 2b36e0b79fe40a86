#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/promotion_service.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::grpc {

class PromotionServer final : public strands::settlement::v1::PromotionService::Service {
public:
  explicit PromotionServer(std::shared_ptr<strands::service::PromotionService> svc);

  ::grpc::Status IssuePromotion(::grpc::ServerContext*,
                                const strands::settlement::v1::IssuePromotionRequest*,
                                strands::settlement::v1::IssuePromotionResponse*) override;

  ::grpc::Status IssueLoyalCustomerPromotions(::grpc::ServerContext*,
                                              const strands::settlement::v1::IssueLoyalCustomerPromotionsRequest*,
                                              strands::settlement::v1::IssueLoyalCustomerPromotionsResponse*) override;

  ::grpc::Status ListPromotions(::grpc::ServerContext*,
                                const strands::settlement::v1::ListPromotionsRequest*,
                                strands::settlement::v1::ListPromotionsResponse*) override;

  ::grpc::Status PreviewPromotion(::grpc::ServerContext*,
                                  const strands::settlement::v1::PreviewPromotionRequest*,
                                  strands::settlement::v1::PreviewPromotionResponse*) override;

private:
  std::shared_ptr<strands::service::PromotionService> service_;
};

} // namespace strands::grpc
