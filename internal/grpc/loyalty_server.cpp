#include "loyalty_server.hpp"
#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace strands::grpc {

LoyaltyServer::LoyaltyServer(std::shared_ptr<strands::service::LoyaltyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status LoyaltyServer::ListRewards(::grpc::ServerContext* ctx,
                                          const strands::settlement::v1::ListRewardsRequest* req,
                                          strands::settlement::v1::ListRewardsResponse* resp) {
  try {
    *resp = service_->ListRewards(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace strands::grpc
