#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/loyalty/accrual_job.hpp"
#include "internal/loyalty/promotion_expiry.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace strands;
using namespace strands::testing;
using strands::loyalty::AccrualStatus;

struct Harness {
  std::shared_ptr<db::memory::MemoryRepository> repo = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<RecordingSink>                sink = std::make_shared<RecordingSink>();
  loyalty::AccrualJob                           job{repo, sink, "no-reply@strands"};

  Harness() {
    SeedAccounts(*repo);
  }
};

void TestCrossingTheTargetMintsOneReward() {
  Harness h;
  SetProgram(*h.repo, kMerchant, 3, 15);
  for (int i = 0; i < 3; ++i) AddCompletedVisit(*h.repo, kCustomer, kMerchant);

  const auto report = h.job.RunSweep(util::NowMillis());
  assert(report.scanned == 3);
  assert(report.processed == 3);
  assert(report.rewards_minted == 1);
  assert(report.failures == 0);

  const auto membership = ReadMembership(*h.repo, kCustomer, kMerchant);
  assert(membership->visits_count == 0);
  assert(membership->total_visits_count == 3);

  auto tx      = h.repo->Begin();
  auto rewards = h.repo->ListRewards(*tx, kCustomer, kMerchant);
  tx->Rollback();
  assert(rewards.size() == 1);
  assert(rewards[0].discount_pct == 15);
  assert(rewards[0].note == "Free blowout");
  assert(rewards[0].State() == model::RewardState::kAvailable);

  const auto sent = h.sink->Sent();
  assert(sent.size() == 1);
  assert(sent[0].category == notify::NotificationCategory::kRewardEarned);

  // nothing left to do
  assert(h.job.RunSweep(util::NowMillis()).scanned == 0);
}

void TestLoweredTargetKeepsOverflow() {
  Harness h;
  SetProgram(*h.repo, kMerchant, 10, 20);
  for (int i = 0; i < 6; ++i) AddCompletedVisit(*h.repo, kCustomer, kMerchant);
  h.job.RunSweep(util::NowMillis());
  assert(ReadMembership(*h.repo, kCustomer, kMerchant)->visits_count == 6);

  SetProgram(*h.repo, kMerchant, 5, 20);
  AddCompletedVisit(*h.repo, kCustomer, kMerchant);
  const auto report = h.job.RunSweep(util::NowMillis());
  assert(report.rewards_minted == 1);
  assert(ReadMembership(*h.repo, kCustomer, kMerchant)->visits_count == 2);
}

void TestVisitsCountWithoutProgram() {
  Harness h;
  AddCompletedVisit(*h.repo, kCustomer, kMerchant);
  const auto report = h.job.RunSweep(util::NowMillis());
  assert(report.processed == 1);
  assert(report.rewards_minted == 0);
  assert(ReadMembership(*h.repo, kCustomer, kMerchant)->visits_count == 1);
}

void TestCanceledAndFutureReservationsNeverAccrue() {
  Harness h;
  SetProgram(*h.repo, kMerchant, 1, 10);
  const auto canceled = AddReservation(*h.repo, kCustomer, kMerchant, {}, model::ReservationStatus::kCanceled);
  const auto upcoming = AddReservation(*h.repo, kCustomer, kMerchant, {}, model::ReservationStatus::kCompleted, 3'600'000);

  auto report = h.job.RunSweep(util::NowMillis());
  assert(report.scanned == 0);
  assert(report.canceled_marked == 1);
  assert(ReadReservation(*h.repo, canceled)->loyalty_seen == model::LoyaltySeen::kCanceledProcessed);
  assert(ReadReservation(*h.repo, upcoming)->loyalty_seen == model::LoyaltySeen::kUnprocessed);
  assert(!ReadMembership(*h.repo, kCustomer, kMerchant).has_value());

  // marked once only
  report = h.job.RunSweep(util::NowMillis());
  assert(report.canceled_marked == 0);
}

void TestReprocessingIsANoOp() {
  Harness h;
  SetProgram(*h.repo, kMerchant, 2, 10);
  const auto id = AddCompletedVisit(*h.repo, kCustomer, kMerchant);

  const auto reservation = *ReadReservation(*h.repo, id);
  assert(h.job.ProcessReservation(reservation, util::NowMillis()).status == AccrualStatus::kProcessed);

  // a stale copy from an overlapping sweep
  const auto again = h.job.ProcessReservation(reservation, util::NowMillis());
  assert(again.status == AccrualStatus::kAlreadyProcessed);
  assert(!again.reward_id);
  assert(ReadMembership(*h.repo, kCustomer, kMerchant)->visits_count == 1);
  assert(ReadMembership(*h.repo, kCustomer, kMerchant)->total_visits_count == 1);
}

void TestConcurrentSweepsDoNotDoubleCount() {
  Harness h;
  SetProgram(*h.repo, kMerchant, 4, 10);
  for (int i = 0; i < 8; ++i) AddCompletedVisit(*h.repo, kCustomer, kMerchant);

  loyalty::AccrualJob second(h.repo, h.sink, "no-reply@strands");
  std::thread         a([&] { h.job.RunSweep(util::NowMillis()); });
  std::thread         b([&] { second.RunSweep(util::NowMillis()); });
  a.join();
  b.join();

  const auto membership = ReadMembership(*h.repo, kCustomer, kMerchant);
  assert(membership->total_visits_count == 8);
  assert(membership->visits_count == 0);

  auto tx      = h.repo->Begin();
  auto rewards = h.repo->ListRewards(*tx, kCustomer, kMerchant);
  tx->Rollback();
  assert(rewards.size() == 2);
}

void TestBatchLimitBoundsOneRun() {
  Harness             h;
  loyalty::AccrualJob limited(h.repo, h.sink, "no-reply@strands", 2);
  for (int i = 0; i < 5; ++i) AddCompletedVisit(*h.repo, kCustomer, kMerchant);

  assert(limited.RunSweep(util::NowMillis()).processed == 2);
  assert(limited.RunSweep(util::NowMillis()).processed == 2);
  assert(limited.RunSweep(util::NowMillis()).processed == 1);
}

void TestExpirySweepFlipsOnlyPastDueCodes() {
  Harness h;
  const auto old_code = AddPromotion(*h.repo, kCustomer, kMerchant, "OLD-ONE", 1000, util::NowMillis() - 10);
  const auto fresh    = AddPromotion(*h.repo, kCustomer, kMerchant, "NEW-ONE", 1000, util::NowMillis() + 86'400'000);
  const auto forever  = AddPromotion(*h.repo, kCustomer, kMerchant, "FOR-EVR", 1000);

  loyalty::PromotionExpirySweep sweep(h.repo);
  assert(sweep.Run(util::NowMillis()) == 1);
  assert(ReadPromotion(*h.repo, old_code)->status == model::PromotionStatus::kExpired);
  assert(ReadPromotion(*h.repo, fresh)->status == model::PromotionStatus::kIssued);
  assert(ReadPromotion(*h.repo, forever)->status == model::PromotionStatus::kIssued);
  assert(sweep.Run(util::NowMillis()) == 0);
}

} // namespace

int main() {
  TestCrossingTheTargetMintsOneReward();
  TestLoweredTargetKeepsOverflow();
  TestVisitsCountWithoutProgram();
  TestCanceledAndFutureReservationsNeverAccrue();
  TestReprocessingIsANoOp();
  TestConcurrentSweepsDoNotDoubleCount();
  TestBatchLimitBoundsOneRun();
  TestExpirySweepFlipsOnlyPastDueCodes();

  std::cout << "strands_unit_accrual_job: pass\n";
  return 0;
}
