#include "settlement_server.hpp"
#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace strands::grpc {

SettlementServer::SettlementServer(std::shared_ptr<strands::service::SettlementService> svc)
    : service_(std::move(svc)) {}

::grpc::Status SettlementServer::SettlePayment(::grpc::ServerContext* ctx,
                                               const strands::settlement::v1::SettlePaymentRequest* req,
                                               strands::settlement::v1::SettlePaymentResponse* resp) {
  try {
    *resp = service_->SettlePayment(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace strands::grpc
