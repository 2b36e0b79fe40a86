#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/loyalty_service.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::grpc {

class LoyaltyServer final : public strands::settlement::v1::LoyaltyService::Service {
public:
  explicit LoyaltyServer(std::shared_ptr<strands::service::LoyaltyService> svc);

  ::grpc::Status ListRewards(::grpc::ServerContext*,
                             const strands::settlement::v1::ListRewardsRequest*,
                             strands::settlement::v1::ListRewardsResponse*) override;

private:
  std::shared_ptr<strands::service::LoyaltyService> service_;
};

} // namespace strands::grpc
