#include "promotion_server.hpp"
#include "caller_identity.hpp"
#include "grpc_error.hpp"

namespace strands::grpc {

using namespace strands::settlement::v1;

PromotionServer::PromotionServer(std::shared_ptr<strands::service::PromotionService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PromotionServer::IssuePromotion(::grpc::ServerContext* ctx,
                                               const IssuePromotionRequest* req,
                                               IssuePromotionResponse* resp) {
  try {
    *resp = service_->IssuePromotion(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PromotionServer::IssueLoyalCustomerPromotions(::grpc::ServerContext* ctx,
                                                             const IssueLoyalCustomerPromotionsRequest* req,
                                                             IssueLoyalCustomerPromotionsResponse* resp) {
  try {
    *resp = service_->IssueLoyalCustomerPromotions(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PromotionServer::ListPromotions(::grpc::ServerContext* ctx,
                                               const ListPromotionsRequest* req,
                                               ListPromotionsResponse* resp) {
  try {
    *resp = service_->ListPromotions(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PromotionServer::PreviewPromotion(::grpc::ServerContext* ctx,
                                                 const PreviewPromotionRequest* req,
                                                 PreviewPromotionResponse* resp) {
  try {
    *resp = service_->PreviewPromotion(CallerId(*ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace strands::grpc
