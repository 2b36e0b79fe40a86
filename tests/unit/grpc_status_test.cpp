#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/promotion_issuer.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/loyalty_server.hpp"
#include "internal/grpc/settlement_server.hpp"
#include "internal/service/loyalty_service.hpp"
#include "internal/service/promotion_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/settlement_service.hpp"
#include "strands/settlement/v1.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace strands;
using namespace strands::testing;
using strands::util::RejectReason;

service::ServiceContext BuildServiceContext() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  SeedAccounts(*repo);

  service::ServiceContext ctx;
  ctx.repository = repo;
  ctx.settlement = std::make_shared<core::SettlementEngine>(repo, std::make_shared<RecordingSink>(), "no-reply@strands");
  ctx.promotions = std::make_shared<core::PromotionIssuer>(repo, "no-reply@strands", 5);
  return ctx;
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;

  struct Case {
    const std::exception& error;
    StatusCode            code;
  };

  const util::InvalidArgument   invalid(RejectReason::kInvalidAmount, "bad amount");
  const util::Unauthenticated   anonymous("Unauthorized");
  const util::PermissionDenied  denied(RejectReason::kReservationNotOwned, "not yours");
  const util::NotFound          missing(RejectReason::kPromoNotFound, "no code");
  const util::InvalidState      state(RejectReason::kPromoExpired, "expired");
  const util::Conflict          conflict(RejectReason::kRewardNoLongerAvailable, "gone");
  const util::ResourceExhausted exhausted(RejectReason::kPromoCodeSpaceExhausted, "full");
  const std::runtime_error      crash("disk on fire");

  const Case cases[] = {
      {invalid, StatusCode::INVALID_ARGUMENT},   {anonymous, StatusCode::UNAUTHENTICATED}, {denied, StatusCode::PERMISSION_DENIED},
      {missing, StatusCode::NOT_FOUND},          {state, StatusCode::FAILED_PRECONDITION}, {conflict, StatusCode::ABORTED},
      {exhausted, StatusCode::RESOURCE_EXHAUSTED}, {crash, StatusCode::INTERNAL},
  };
  for (const auto& c : cases) {
    assert(strands::grpc::ToStatus(c.error).error_code() == c.code);
  }

  assert(strands::grpc::ToStatus(conflict).error_details() == "REWARD_NO_LONGER_AVAILABLE");
  assert(strands::grpc::ToStatus(state).error_message() == "expired");

  // backend text is not echoed to callers
  assert(strands::grpc::ToStatus(crash).error_message() == "internal error");
  assert(strands::grpc::ToStatus(crash).error_details().empty());
}

void TestMissingCallerIsUnauthenticated() {
  auto ctx = BuildServiceContext();
  strands::grpc::SettlementServer server(std::make_shared<service::SettlementService>(ctx));

  settlement::v1::SettlePaymentRequest  req;
  settlement::v1::SettlePaymentResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server.SettlePayment(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  strands::grpc::LoyaltyServer loyalty(std::make_shared<service::LoyaltyService>(ctx));
  settlement::v1::ListRewardsRequest  rewards_req;
  settlement::v1::ListRewardsResponse rewards_resp;
  ::grpc::ServerContext               loyalty_ctx;
  assert(loyalty.ListRewards(&loyalty_ctx, &rewards_req, &rewards_resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestSettlementResponseCarriesDiscountDetails() {
  auto       ctx    = BuildServiceContext();
  const auto id     = AddReservation(*ctx.repository, kCustomer, kMerchant);
  const auto reward = AddReward(*ctx.repository, kCustomer, kMerchant, 20);

  service::SettlementService svc(ctx);

  settlement::v1::SettlePaymentRequest req;
  req.set_instrument_id(kCard);
  req.set_billing_address_id(kAddress);
  req.set_amount("100");
  req.set_reservation_id(id);
  req.set_reward_id(reward);

  const auto resp = svc.SettlePayment(kCustomer, req);
  assert(resp.payment_id() != 0);
  assert(resp.amount() == "80.00");
  assert(resp.original_amount() == "100.00");
  assert(resp.discount_type() == settlement::v1::DISCOUNT_TYPE_LOYALTY);
  assert(resp.discount_percentage() == "20");
  assert(resp.reward_id() == reward);
  assert(resp.promotion_id() == 0);
  assert(resp.booking_updated());
}

void TestUndiscountedResponseLeavesOriginalEmpty() {
  auto       ctx = BuildServiceContext();
  const auto id  = AddReservation(*ctx.repository, kCustomer, kMerchant);

  service::SettlementService svc(ctx);

  settlement::v1::SettlePaymentRequest req;
  req.set_instrument_id(kCard);
  req.set_billing_address_id(kAddress);
  req.set_amount("42.5");
  req.set_reservation_id(id);

  const auto resp = svc.SettlePayment(kCustomer, req);
  assert(resp.amount() == "42.50");
  assert(resp.original_amount().empty());
  assert(resp.discount_type() == settlement::v1::DISCOUNT_TYPE_NONE);
}

void TestListRewardsAndPromotions() {
  auto ctx = BuildServiceContext();
  AddReward(*ctx.repository, kCustomer, kMerchant, 15);
  AddPromotion(*ctx.repository, kCustomer, kMerchant, "OLD-ONE", 1250, util::NowMillis() - 1);

  service::LoyaltyService loyalty(ctx);
  settlement::v1::ListRewardsRequest rewards_req;
  rewards_req.set_merchant_id(kMerchant);
  const auto rewards = loyalty.ListRewards(kCustomer, rewards_req);
  assert(rewards.rewards_size() == 1);
  assert(rewards.rewards(0).discount_percentage() == 15);
  assert(rewards.rewards(0).active());
  assert(!rewards.rewards(0).has_redeemed_at());

  bool rejected = false;
  try {
    loyalty.ListRewards(kCustomer, settlement::v1::ListRewardsRequest{});
  } catch (const util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  service::PromotionService promotions(ctx);
  const auto listed = promotions.ListPromotions(kCustomer, settlement::v1::ListPromotionsRequest{});
  assert(listed.promotions_size() == 1);
  assert(listed.promotions(0).status() == settlement::v1::PROMOTION_STATUS_EXPIRED);
  assert(listed.promotions(0).discount_percentage() == "12.5");
  assert(listed.promotions(0).has_expires_at());
  assert(!listed.promotions(0).has_redeemed_at());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingCallerIsUnauthenticated();
  TestSettlementResponseCarriesDiscountDetails();
  TestUndiscountedResponseLeavesOriginalEmpty();
  TestListRewardsAndPromotions();

  std::cout << "strands_unit_grpc_status: pass\n";
  return 0;
}
