#include "client/cpp/settlement_client.h"

#include <string>

namespace strands::settlement::client {

namespace {

constexpr char kUserIdMetadataKey[] = "x-strands-user-id";

bool IsDecimalText(std::string_view text) {
  bool seen_digit = false;
  bool seen_dot   = false;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c >= '0' && c <= '9') {
      seen_digit = true;
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else if ((c == '-' || c == '+') && i == 0) {
      continue;
    } else {
      return false;
    }
  }
  return seen_digit;
}

::grpc::Status Invalid(const std::string& message) {
  return {::grpc::StatusCode::INVALID_ARGUMENT, message};
}

} // namespace

SettlementClient::SettlementClient(std::shared_ptr<::grpc::Channel> channel, uint64_t user_id)
    : user_id_(user_id),
      settlement_stub_(strands::settlement::v1::SettlementService::NewStub(channel)),
      promotion_stub_(strands::settlement::v1::PromotionService::NewStub(channel)),
      loyalty_stub_(strands::settlement::v1::LoyaltyService::NewStub(channel)) {}

void SettlementClient::PrepareContext(::grpc::ClientContext* context) const {
  context->AddMetadata(kUserIdMetadataKey, std::to_string(user_id_));
}

::grpc::Status SettlementClient::ValidateSettleRequest(const strands::settlement::v1::SettlePaymentRequest& request) {
  using Request = strands::settlement::v1::SettlePaymentRequest;

  if (request.instrument_id() == 0 || request.billing_address_id() == 0) {
    return Invalid("instrument_id and billing_address_id are required");
  }
  if (request.target_case() == Request::TARGET_NOT_SET) {
    return Invalid("one of reservation_id or order_id is required");
  }
  if (!IsDecimalText(request.amount())) {
    return Invalid("amount must be a decimal number");
  }
  return ::grpc::Status::OK;
}

std::string_view SettlementClient::RejectReason(const ::grpc::Status& status) {
  return status.error_details();
}

::grpc::Status SettlementClient::SettlePayment(const strands::settlement::v1::SettlePaymentRequest& request,
                                             strands::settlement::v1::SettlePaymentResponse*      response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }
  if (auto status = ValidateSettleRequest(request); !status.ok()) {
    return status;
  }

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return settlement_stub_->SettlePayment(&context, request, response);
}

::grpc::Status SettlementClient::IssuePromotion(const strands::settlement::v1::IssuePromotionRequest& request,
                                              strands::settlement::v1::IssuePromotionResponse*      response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }
  if (!IsDecimalText(request.discount_percentage())) {
    return Invalid("discount_percentage must be a decimal number");
  }

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return promotion_stub_->IssuePromotion(&context, request, response);
}

::grpc::Status SettlementClient::IssueLoyalCustomerPromotions(const strands::settlement::v1::IssueLoyalCustomerPromotionsRequest& request,
                                                            strands::settlement::v1::IssueLoyalCustomerPromotionsResponse*      response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }
  if (!IsDecimalText(request.discount_percentage())) {
    return Invalid("discount_percentage must be a decimal number");
  }

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return promotion_stub_->IssueLoyalCustomerPromotions(&context, request, response);
}

::grpc::Status SettlementClient::ListPromotions(strands::settlement::v1::ListPromotionsResponse* response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return promotion_stub_->ListPromotions(&context, strands::settlement::v1::ListPromotionsRequest{}, response);
}

::grpc::Status SettlementClient::PreviewPromotion(const strands::settlement::v1::PreviewPromotionRequest& request,
                                                strands::settlement::v1::PreviewPromotionResponse*      response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }
  if (request.code().empty() || request.reservation_id() == 0) {
    return Invalid("code and reservation_id are required");
  }

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return promotion_stub_->PreviewPromotion(&context, request, response);
}

::grpc::Status SettlementClient::ListRewards(uint64_t merchant_id, strands::settlement::v1::ListRewardsResponse* response) const {
  if (user_id_ == 0) {
    return Invalid("user id is required");
  }

  strands::settlement::v1::ListRewardsRequest request;
  request.set_merchant_id(merchant_id);

  ::grpc::ClientContext context;
  PrepareContext(&context);
  return loyalty_stub_->ListRewards(&context, request, response);
}

} // namespace strands::settlement::client
