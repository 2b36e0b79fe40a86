#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/settlement_service.hpp"
#include "strands/settlement/v1.hpp"

namespace strands::grpc {

class SettlementServer final : public strands::settlement::v1::SettlementService::Service {
public:
  explicit SettlementServer(std::shared_ptr<strands::service::SettlementService> svc);

  ::grpc::Status SettlePayment(::grpc::ServerContext*,
                               const strands::settlement::v1::SettlePaymentRequest*,
                               strands::settlement::v1::SettlePaymentResponse*) override;

private:
  std::shared_ptr<strands::service::SettlementService> service_;
};

} // namespace strands::grpc
