#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "client/cpp/settlement_client.h"
#include "internal/core/promotion_issuer.hpp"
#include "internal/core/settlement_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/loyalty_server.hpp"
#include "internal/grpc/promotion_server.hpp"
#include "internal/grpc/settlement_server.hpp"
#include "internal/service/loyalty_service.hpp"
#include "internal/service/promotion_service.hpp"
#include "internal/service/settlement_service.hpp"
#include "tests/support/fixtures.hpp"

namespace {

namespace v1 = strands::settlement::v1;

using strands::settlement::client::SettlementClient;
using namespace strands::testing;

// In-process server wired the way the binary wires it, on the memory store.
struct Harness {
  std::shared_ptr<strands::db::memory::MemoryRepository> repository = std::make_shared<strands::db::memory::MemoryRepository>();
  std::shared_ptr<RecordingSink>                         sink       = std::make_shared<RecordingSink>();

  std::unique_ptr<strands::grpc::SettlementServer> settlement;
  std::unique_ptr<strands::grpc::PromotionServer>  promotion;
  std::unique_ptr<strands::grpc::LoyaltyServer>    loyalty;
  std::unique_ptr<::grpc::Server>                  server;

  Harness() {
    SeedAccounts(*repository);

    strands::service::ServiceContext ctx;
    ctx.repository = repository;
    ctx.settlement = std::make_shared<strands::core::SettlementEngine>(repository, sink, "no-reply@strands");
    ctx.promotions = std::make_shared<strands::core::PromotionIssuer>(repository, "no-reply@strands", 3);

    settlement = std::make_unique<strands::grpc::SettlementServer>(std::make_shared<strands::service::SettlementService>(ctx));
    promotion  = std::make_unique<strands::grpc::PromotionServer>(std::make_shared<strands::service::PromotionService>(ctx));
    loyalty    = std::make_unique<strands::grpc::LoyaltyServer>(std::make_shared<strands::service::LoyaltyService>(ctx));

    ::grpc::ServerBuilder builder;
    builder.RegisterService(settlement.get());
    builder.RegisterService(promotion.get());
    builder.RegisterService(loyalty.get());
    server = builder.BuildAndStart();
    assert(server);
  }

  ~Harness() {
    server->Shutdown();
  }

  std::shared_ptr<::grpc::Channel> Channel() {
    return server->InProcessChannel(::grpc::ChannelArguments());
  }
};

v1::SettlePaymentRequest SettleFor(uint64_t reservation_id, const std::string& amount) {
  v1::SettlePaymentRequest req;
  req.set_instrument_id(kCard);
  req.set_billing_address_id(kAddress);
  req.set_amount(amount);
  req.set_reservation_id(reservation_id);
  return req;
}

void TestRewardSettlementOverTheWire() {
  Harness h;
  SettlementClient client(h.Channel(), kCustomer);

  const auto reservation = AddReservation(*h.repository, kCustomer, kMerchant, {{10000, 0}});
  const auto reward      = AddReward(*h.repository, kCustomer, kMerchant, 20);

  auto req = SettleFor(reservation, "100");
  req.set_reward_id(reward);

  v1::SettlePaymentResponse resp;
  auto status = client.SettlePayment(req, &resp);
  assert(status.ok());
  assert(resp.payment_id() != 0);
  assert(resp.amount() == "80.00");
  assert(resp.original_amount() == "100.00");
  assert(resp.discount_type() == v1::DISCOUNT_TYPE_LOYALTY);
  assert(resp.discount_percentage() == "20");
  assert(resp.reward_id() == reward);
  assert(resp.booking_updated());

  v1::ListRewardsResponse rewards;
  assert(client.ListRewards(kMerchant, &rewards).ok());
  assert(rewards.rewards_size() == 1);
  assert(!rewards.rewards(0).active());
  assert(rewards.rewards(0).has_redeemed_at());

  // a spent reward is refused and the reason travels in the status details
  const auto second = AddReservation(*h.repository, kCustomer, kMerchant, {{10000, 0}});
  auto again        = SettleFor(second, "100");
  again.set_reward_id(reward);
  v1::SettlePaymentResponse ignored;
  status = client.SettlePayment(again, &ignored);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(SettlementClient::RejectReason(status) == "REWARD_NOT_ELIGIBLE");
  assert(!ReadReservation(*h.repository, second).has_value());
}

void TestPlainSettlementHasNoDiscountFields() {
  Harness h;
  SettlementClient client(h.Channel(), kCustomer);

  const auto reservation = AddReservation(*h.repository, kCustomer, kMerchant, {{4500, 0}});
  v1::SettlePaymentResponse resp;
  assert(client.SettlePayment(SettleFor(reservation, "45"), &resp).ok());
  assert(resp.amount() == "45.00");
  assert(resp.original_amount().empty());
  assert(resp.discount_type() == v1::DISCOUNT_TYPE_NONE);
  assert(resp.discount_percentage().empty());
}

void TestCallerIdentityIsRequired() {
  Harness h;

  // the client refuses locally
  SettlementClient anonymous(h.Channel(), 0);
  v1::SettlePaymentResponse resp;
  auto status = anonymous.SettlePayment(SettleFor(1, "10"), &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  // a raw stub without metadata reaches the server and is refused there
  auto                  stub = v1::SettlementService::NewStub(h.Channel());
  ::grpc::ClientContext ctx;
  status = stub->SettlePayment(&ctx, SettleFor(1, "10"), &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  ::grpc::ClientContext bad;
  bad.AddMetadata("x-strands-user-id", "abc");
  status = stub->SettlePayment(&bad, SettleFor(1, "10"), &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestClientSideValidation() {
  v1::SettlePaymentRequest req = SettleFor(7, "12.50");
  assert(SettlementClient::ValidateSettleRequest(req).ok());

  auto no_target = req;
  no_target.clear_reservation_id();
  assert(SettlementClient::ValidateSettleRequest(no_target).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  auto bad_amount = req;
  bad_amount.set_amount("12,50");
  assert(SettlementClient::ValidateSettleRequest(bad_amount).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  auto no_card = req;
  no_card.set_instrument_id(0);
  assert(SettlementClient::ValidateSettleRequest(no_card).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  auto order = req;
  order.set_order_id(3);
  assert(SettlementClient::ValidateSettleRequest(order).ok());
}

void TestPromotionIssueListAndPreview() {
  Harness h;
  SettlementClient owner(h.Channel(), kOwner);
  SettlementClient customer(h.Channel(), kCustomer);

  const auto reservation = AddReservation(*h.repository, kCustomer, kMerchant, {{6000, 0}, {2000, 0}});

  v1::IssuePromotionRequest issue;
  issue.set_merchant_id(kMerchant);
  issue.set_customer_id(kCustomer);
  issue.set_description("Welcome back");
  issue.set_discount_percentage("25");

  v1::IssuePromotionResponse issued;
  assert(owner.IssuePromotion(issue, &issued).ok());
  const auto code = issued.promotion().code();
  assert(!code.empty());
  assert(issued.promotion().discount_percentage() == "25");
  assert(issued.promotion().status() == v1::PROMOTION_STATUS_ISSUED);

  // only the owner may issue for the salon
  v1::IssuePromotionResponse denied;
  auto status = customer.IssuePromotion(issue, &denied);
  assert(!status.ok());
  assert(SettlementClient::RejectReason(status) == "MERCHANT_NOT_FOUND");

  v1::ListPromotionsResponse listed;
  assert(customer.ListPromotions(&listed).ok());
  assert(listed.promotions_size() == 1);
  assert(listed.promotions(0).code() == code);

  v1::PreviewPromotionRequest preview;
  preview.set_code(code);
  preview.set_reservation_id(reservation);
  v1::PreviewPromotionResponse previewed;
  assert(customer.PreviewPromotion(preview, &previewed).ok());
  assert(previewed.original_total() == "80.00");
  assert(previewed.discount_amount() == "20.00");
  assert(previewed.discounted_total() == "60.00");

  auto req = SettleFor(reservation, "80");
  req.set_promo_code(code);
  v1::SettlePaymentResponse paid;
  assert(customer.SettlePayment(req, &paid).ok());
  assert(paid.amount() == "60.00");
  assert(paid.discount_type() == v1::DISCOUNT_TYPE_PROMO);
  assert(paid.promotion_id() == issued.promotion().promotion_id());

  auto tx    = h.repository->Begin();
  auto inbox = h.repository->ListNotifications(*tx, kCustomer);
  tx->Rollback();
  assert(!inbox.empty());
  assert(inbox[0].promo_code == code);
}

} // namespace

int main() {
  TestRewardSettlementOverTheWire();
  TestPlainSettlementHasNoDiscountFields();
  TestCallerIdentityIsRequired();
  TestClientSideValidation();
  TestPromotionIssueListAndPreview();

  std::cout << "strands_integration_grpc_roundtrip: pass\n";
  return 0;
}
