#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/promotion_issuer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/promo_code.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace strands;
using namespace strands::testing;
using strands::util::RejectReason;

core::IssuePromotionRequest Offer(const std::string& pct) {
  core::IssuePromotionRequest req;
  req.owner_user_id       = kOwner;
  req.merchant_id         = kMerchant;
  req.customer_id         = kCustomer;
  req.description         = "Weekday blowout";
  req.discount_percentage = pct;
  req.expires_at_ms       = util::NowMillis() + 7 * 86'400'000ULL;
  return req;
}

std::shared_ptr<db::memory::MemoryRepository> SeededRepo() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  SeedAccounts(*repo);
  AddReservation(*repo, kCustomer, kMerchant, {}, model::ReservationStatus::kCompleted);
  return repo;
}

void SetTotalVisits(db::Repository& repo, uint64_t customer_id, uint32_t total) {
  InTx(repo, [&](db::Transaction& tx) {
    db::model::MembershipRecord m;
    Require(repo.LockMembership(tx, customer_id, kMerchant, m));
    m.total_visits_count = total;
    Require(repo.UpdateMembership(tx, m));
  });
}

void TestIssueCreatesCodeAndInboxMessage() {
  auto                  repo = SeededRepo();
  core::PromotionIssuer issuer(repo, "no-reply@strands", 5);

  const auto issued = issuer.Issue(Offer("12.5"));
  assert(issued.promotion.id != 0);
  assert(util::IsWellFormedPromoCode(issued.promotion.code));
  assert(issued.promotion.discount_bps == 1250);
  assert(issued.promotion.status == model::PromotionStatus::kIssued);
  assert(issued.notification_id != 0);

  auto tx    = repo->Begin();
  auto inbox = repo->ListNotifications(*tx, kCustomer);
  tx->Rollback();
  assert(inbox.size() == 1);
  assert(inbox[0].category == "LOYALTY_PROMO");
  assert(inbox[0].promotion_id == issued.promotion.id);
  assert(inbox[0].sender_email == "hello@shearjoy.example");
  assert(inbox[0].message.find(issued.promotion.code) != std::string::npos);
  assert(inbox[0].message.find("Shear Joy") != std::string::npos);
  assert(inbox[0].message.find("12.5%") != std::string::npos);
}

void TestIssueRejections() {
  auto                  repo = SeededRepo();
  core::PromotionIssuer issuer(repo, "no-reply@strands", 5);

  assert(RejectionOf([&] { issuer.Issue(Offer("0")); }) == RejectReason::kInvalidDiscountPercentage);
  assert(RejectionOf([&] { issuer.Issue(Offer("100.5")); }) == RejectReason::kInvalidDiscountPercentage);
  assert(RejectionOf([&] { issuer.Issue(Offer("lots")); }) == RejectReason::kInvalidDiscountPercentage);

  auto stale          = Offer("10");
  stale.expires_at_ms = util::NowMillis() - 1;
  assert(RejectionOf([&] { issuer.Issue(stale); }) == RejectReason::kInvalidExpiry);

  auto not_owner          = Offer("10");
  not_owner.owner_user_id = kOwner + 1;
  assert(RejectionOf([&] { issuer.Issue(not_owner); }) == RejectReason::kMerchantNotFound);

  auto stranger        = Offer("10");
  stranger.customer_id = kOther; // never booked here
  assert(RejectionOf([&] { issuer.Issue(stranger); }) == RejectReason::kCustomerNotEligible);
}

void TestCodeCollisionsRetryThenExhaust() {
  auto repo = SeededRepo();
  AddPromotion(*repo, kOther, kMerchant, "AAA-AAA", 1000);

  std::vector<std::string> codes = {"AAA-AAA", "BBB-BBB"};
  size_t                   next  = 0;
  core::PromotionIssuer    retrying(repo, "no-reply@strands", 5, [&] { return codes[next++ % codes.size()]; });
  assert(retrying.Issue(Offer("10")).promotion.code == "BBB-BBB");

  core::PromotionIssuer stuck(repo, "no-reply@strands", 5, [] { return std::string("AAA-AAA"); });
  assert(RejectionOf([&] { stuck.Issue(Offer("10")); }) == RejectReason::kPromoCodeSpaceExhausted);
}

void TestBulkIssueTargetsLoyalMembersOnly() {
  auto repo = SeededRepo();
  SetTotalVisits(*repo, kCustomer, 6);
  SetTotalVisits(*repo, kOther, 2);
  SetTotalVisits(*repo, 300, 5);

  core::PromotionIssuer issuer(repo, "no-reply@strands", 5);

  core::LoyalCustomerIssueRequest req;
  req.owner_user_id       = kOwner;
  req.merchant_id         = kMerchant;
  req.description         = "Thank you";
  req.discount_percentage = "15";

  const auto report = issuer.IssueToLoyalCustomers(req);
  assert(report.eligible == 2);
  assert(report.issued == 2);
  assert(report.failed == 0);

  assert(issuer.List(kCustomer).size() == 1);
  assert(issuer.List(300).size() == 1);
  assert(issuer.List(kOther).empty());

  req.min_total_visits = 6;
  assert(issuer.IssueToLoyalCustomers(req).eligible == 1);
}

void TestListReportsEffectiveStatus() {
  auto repo = SeededRepo();
  AddPromotion(*repo, kCustomer, kMerchant, "OLD-ONE", 1000, util::NowMillis() - 1);
  AddPromotion(*repo, kCustomer, kMerchant, "NEW-ONE", 1000, util::NowMillis() + 86'400'000);

  core::PromotionIssuer issuer(repo, "no-reply@strands", 5);
  const auto            promos = issuer.List(kCustomer);
  assert(promos.size() == 2);
  for (const auto& p : promos) {
    assert(p.status == (p.code == "OLD-ONE" ? model::PromotionStatus::kExpired : model::PromotionStatus::kIssued));
  }
}

void TestPreviewPricesWithoutRedeeming() {
  auto       repo  = SeededRepo();
  const auto id    = AddReservation(*repo, kCustomer, kMerchant, {{6000, 7001}, {4000, 0}});
  const auto promo = AddPromotion(*repo, kCustomer, kMerchant, "K7M-Q2X", 1250);

  core::PromotionIssuer issuer(repo, "no-reply@strands", 5);
  const auto            preview = issuer.Preview(kCustomer, "k7m-q2x", id);
  assert(preview.promotion.id == promo);
  assert(preview.original_total == 10000);
  assert(preview.discount_amount == 1250);
  assert(preview.discounted_total == 8750);
  assert(ReadPromotion(*repo, promo)->status == model::PromotionStatus::kIssued);

  assert(RejectionOf([&] { issuer.Preview(kOther, "K7M-Q2X", id); }) == RejectReason::kReservationNotOwned);
  assert(RejectionOf([&] { issuer.Preview(kCustomer, "K7M-Q2X", 999'999); }) == RejectReason::kReservationNotFound);
  assert(RejectionOf([&] { issuer.Preview(kCustomer, "ZZZ-ZZZ", id); }) == RejectReason::kPromoNotFound);

  const auto elsewhere = AddReservation(*repo, kCustomer, kMerchant + 1);
  assert(RejectionOf([&] { issuer.Preview(kCustomer, "K7M-Q2X", elsewhere); }) == RejectReason::kPromoNotFound);

  AddPromotion(*repo, kCustomer, kMerchant, "GON-ENN", 1000, util::NowMillis() - 1);
  assert(RejectionOf([&] { issuer.Preview(kCustomer, "GON-ENN", id); }) == RejectReason::kPromoExpired);
}

} // namespace

int main() {
  TestIssueCreatesCodeAndInboxMessage();
  TestIssueRejections();
  TestCodeCollisionsRetryThenExhaust();
  TestBulkIssueTargetsLoyalMembersOnly();
  TestListReportsEffectiveStatus();
  TestPreviewPricesWithoutRedeeming();

  std::cout << "strands_unit_promotion_issuer: pass\n";
  return 0;
}
