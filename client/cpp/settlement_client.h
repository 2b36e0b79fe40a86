#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "strands/settlement/v1.hpp"

namespace strands::settlement::client {

/*
  SettlementClient

  Blocking client for the settlement, promotion and loyalty services.
  Every call is made on behalf of one authenticated user, passed in
  the x-strands-user-id metadata entry.

  Requests that can be rejected locally (missing user, missing target,
  malformed amount text) fail with INVALID_ARGUMENT before any RPC.
*/
class SettlementClient {
 public:
  SettlementClient(std::shared_ptr<::grpc::Channel> channel, uint64_t user_id);

  ::grpc::Status SettlePayment(const strands::settlement::v1::SettlePaymentRequest& request,
                             strands::settlement::v1::SettlePaymentResponse*      response) const;

  ::grpc::Status IssuePromotion(const strands::settlement::v1::IssuePromotionRequest& request,
                              strands::settlement::v1::IssuePromotionResponse*      response) const;

  ::grpc::Status IssueLoyalCustomerPromotions(const strands::settlement::v1::IssueLoyalCustomerPromotionsRequest& request,
                                            strands::settlement::v1::IssueLoyalCustomerPromotionsResponse*      response) const;

  ::grpc::Status ListPromotions(strands::settlement::v1::ListPromotionsResponse* response) const;

  ::grpc::Status PreviewPromotion(const strands::settlement::v1::PreviewPromotionRequest& request,
                                strands::settlement::v1::PreviewPromotionResponse*      response) const;

  ::grpc::Status ListRewards(uint64_t merchant_id, strands::settlement::v1::ListRewardsResponse* response) const;

  static ::grpc::Status ValidateSettleRequest(const strands::settlement::v1::SettlePaymentRequest& request);

  // Reject reason carried by a failed call, empty when the server sent none.
  static std::string_view RejectReason(const ::grpc::Status& status);

 private:
  void PrepareContext(::grpc::ClientContext* context) const;

  uint64_t user_id_;

  std::unique_ptr<strands::settlement::v1::SettlementService::Stub> settlement_stub_;
  std::unique_ptr<strands::settlement::v1::PromotionService::Stub>  promotion_stub_;
  std::unique_ptr<strands::settlement::v1::LoyaltyService::Stub>    loyalty_stub_;
};

} // namespace strands::settlement::client
