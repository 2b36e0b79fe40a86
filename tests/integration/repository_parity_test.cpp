#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/settlement_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/loyalty/accrual_job.hpp"
#include "tests/support/fixtures.hpp"

#if STRANDS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STRANDS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace {

using strands::db::CasResult;
using strands::db::ErrorCode;
using strands::db::Repository;
using strands::db::Transaction;
using strands::db::memory::MemoryRepository;
using strands::model::LoyaltySeen;
using strands::model::PromotionStatus;
using strands::model::ReservationStatus;
using strands::testing::InTx;
using strands::testing::Require;

namespace model = strands::db::model;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

/*
  Ids owned by one suite run. Postgres databases outlive the test, so
  every externally assigned id is offset by a per-run base.
*/
struct Scope {
  uint64_t base;

  uint64_t Owner() const { return base + 1; }
  uint64_t Customer() const { return base + 2; }
  uint64_t Other() const { return base + 3; }
  uint64_t Staff() const { return base + 4; }
  uint64_t Merchant() const { return base + 10; }
  uint64_t Card() const { return base + 20; }
  uint64_t Address() const { return base + 30; }
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void SeedScope(Repository& repo, const Scope& s) {
  InTx(repo, [&](Transaction& tx) {
    Require(repo.InsertMerchant(tx, {s.Merchant(), s.Owner(), "Parity Salon", "desk@parity.example"}));
    Require(repo.InsertInstrument(tx, {s.Card(), s.Customer()}));
    Require(repo.InsertBillingAddress(tx, {s.Address(), s.Customer()}));
  });
}

uint64_t InsertReservation(Repository& repo, const Scope& s, uint64_t customer_id, ReservationStatus status, uint64_t end_ms) {
  model::ReservationRecord r;
  r.customer_id        = customer_id;
  r.merchant_id        = s.Merchant();
  r.status             = status;
  r.scheduled_start_ms = end_ms - 1'800'000;
  r.scheduled_end_ms   = end_ms;
  r.created_at_ms      = NowMs();
  InTx(repo, [&](Transaction& tx) { Require(repo.InsertReservation(tx, r)); });
  assert(r.id != 0);
  return r.id;
}

uint64_t InsertReservationInTx(Repository& repo, Transaction& tx, const Scope& s) {
  model::ReservationRecord r;
  r.customer_id   = s.Customer();
  r.merchant_id   = s.Merchant();
  r.created_at_ms = NowMs();
  Require(repo.InsertReservation(tx, r));
  return r.id;
}

void VerifyAccountsAndOwnership(Repository& repo, const Scope& s) {
  auto tx = repo.Begin();

  auto merchant = repo.GetMerchant(*tx, s.Merchant());
  assert(merchant.has_value());
  assert(merchant->owner_user_id == s.Owner());
  assert(merchant->name == "Parity Salon");
  assert(merchant->sender_email == "desk@parity.example");

  assert(repo.InstrumentBelongsTo(*tx, s.Card(), s.Customer()));
  assert(!repo.InstrumentBelongsTo(*tx, s.Card(), s.Other()));
  assert(repo.BillingAddressBelongsTo(*tx, s.Address(), s.Customer()));
  assert(!repo.BillingAddressBelongsTo(*tx, s.Address() + 1, s.Customer()));

  tx->Rollback();

  auto dup_tx = repo.Begin();
  auto dup    = repo.InsertMerchant(*dup_tx, {s.Merchant(), s.Other(), "Again", ""});
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
  dup_tx->Rollback();
}

void VerifyReservationCas(Repository& repo, const Scope& s) {
  const auto id = InsertReservation(repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 3'600'000);

  {
    auto tx = repo.Begin();
    Require(repo.InsertReservationService(*tx, {id, 1, s.Staff(), 4500, 30}));
    Require(repo.InsertReservationService(*tx, {id, 2, 0, 2000, 15}));

    auto lines = repo.ListReservationServices(*tx, id);
    assert(lines.size() == 2);
    int64_t total = 0;
    for (const auto& l : lines) total += l.price_cents;
    assert(total == 6500);
    assert(repo.CountReservations(*tx, s.Customer(), s.Merchant()) >= 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    // wrong owner and wrong status never match
    assert(!repo.DeletePendingReservation(*tx, id, s.Other()));
    assert(repo.TransitionReservation(*tx, id, ReservationStatus::kPending, ReservationStatus::kScheduled));
    assert(!repo.TransitionReservation(*tx, id, ReservationStatus::kPending, ReservationStatus::kScheduled));
    auto missed = repo.DeletePendingReservation(*tx, id, s.Customer());
    assert(missed.status && !missed.swapped);
    tx->Commit();
  }

  const auto pending = InsertReservation(repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 3'600'000);
  InTx(repo, [&](Transaction& tx) { assert(repo.DeletePendingReservation(tx, pending, s.Customer())); });

  auto tx = repo.Begin();
  assert(repo.GetReservation(*tx, id)->status == ReservationStatus::kScheduled);
  assert(!repo.GetReservation(*tx, pending).has_value());
  tx->Rollback();
}

void VerifyPaymentAndRewardRedemption(Repository& repo, const Scope& s) {
  const auto reservation = InsertReservation(repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 3'600'000);

  model::RewardRecord reward;
  reward.customer_id   = s.Customer();
  reward.merchant_id   = s.Merchant();
  reward.discount_pct  = 25;
  reward.note          = "Quarter off";
  reward.created_at_ms = NowMs();
  InTx(repo, [&](Transaction& tx) { Require(repo.InsertReward(tx, reward)); });
  assert(reward.id != 0);

  auto tx = repo.Begin();
  assert(repo.FindRedeemableReward(*tx, reward.id, s.Customer(), s.Merchant()).has_value());
  assert(!repo.FindRedeemableReward(*tx, reward.id, s.Other(), s.Merchant()).has_value());
  assert(!repo.FindRedeemableReward(*tx, reward.id, s.Customer(), s.Merchant() + 1).has_value());

  model::PaymentRecord payment;
  payment.customer_id        = s.Customer();
  payment.reservation_id     = reservation;
  payment.instrument_id      = s.Card();
  payment.billing_address_id = s.Address();
  payment.reward_id          = reward.id;
  payment.amount_cents       = 7500;
  payment.created_at_ms      = NowMs();
  Require(repo.InsertPayment(*tx, payment));
  assert(payment.id != 0);

  const auto redeemed_at = NowMs();
  assert(repo.RedeemReward(*tx, reward.id, s.Customer(), s.Merchant(), redeemed_at));
  assert(!repo.RedeemReward(*tx, reward.id, s.Customer(), s.Merchant(), redeemed_at));
  tx->Commit();

  auto read = repo.Begin();
  auto stored_payment = repo.GetPayment(*read, payment.id);
  assert(stored_payment.has_value());
  assert(stored_payment->amount_cents == 7500);
  assert(stored_payment->reservation_id == reservation);
  assert(!stored_payment->order_id.has_value());
  assert(stored_payment->reward_id == reward.id);
  assert(!stored_payment->promotion_id.has_value());
  assert(repo.ListPaymentsForReservation(*read, reservation).size() == 1);

  auto stored_reward = repo.GetReward(*read, reward.id);
  assert(!stored_reward->active);
  assert(stored_reward->redeemed_at_ms == redeemed_at);
  assert(stored_reward->State() == strands::model::RewardState::kRedeemed);
  assert(repo.ListRewards(*read, s.Customer(), s.Merchant()).size() == 1);
  read->Rollback();

  // a payment naming both discounts is refused by the store
  auto bad_tx = repo.Begin();
  model::PaymentRecord both = payment;
  both.id                   = 0;
  both.promotion_id         = 1;
  assert(!repo.InsertPayment(*bad_tx, both));
  bad_tx->Rollback();
}

void VerifyPromotions(Repository& repo, const Scope& s) {
  const auto now = NowMs();

  model::PromotionRecord live;
  live.customer_id   = s.Customer();
  live.merchant_id   = s.Merchant();
  live.code          = "PAR-ITY";
  live.description   = "parity";
  live.discount_bps  = 1250;
  live.issued_at_ms  = now;
  live.expires_at_ms = now + 86'400'000;

  model::PromotionRecord stale = live;
  stale.code                   = "OLD-PAR";
  stale.expires_at_ms          = now - 1000;

  InTx(repo, [&](Transaction& tx) {
    Require(repo.InsertPromotion(tx, live));
    Require(repo.InsertPromotion(tx, stale));
  });

  {
    auto tx        = repo.Begin();
    auto duplicate = live;
    duplicate.id   = 0;
    auto r         = repo.InsertPromotion(*tx, duplicate);
    assert(!r);
    assert(r.code == ErrorCode::AlreadyExists || r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx    = repo.Begin();
  auto found = repo.FindIssuedPromotion(*tx, "PAR-ITY", s.Customer(), s.Merchant());
  assert(found.has_value());
  assert(found->discount_bps == 1250);
  assert(found->expires_at_ms == live.expires_at_ms);
  assert(!repo.FindIssuedPromotion(*tx, "PAR-ITY", s.Other(), s.Merchant()).has_value());
  assert(repo.PromotionCodeExists(*tx, s.Merchant(), "PAR-ITY"));
  assert(!repo.PromotionCodeExists(*tx, s.Merchant(), "NOP-ENO"));

  const auto reservation = InsertReservationInTx(repo, *tx, s);
  model::PromotionRedemption stamp{now, reservation, 4242};
  assert(repo.RedeemPromotion(*tx, live.id, s.Customer(), stamp));
  assert(!repo.RedeemPromotion(*tx, live.id, s.Customer(), stamp));
  assert(!repo.RedeemPromotion(*tx, stale.id, s.Other(), stamp));

  uint64_t expired = 0;
  Require(repo.ExpirePromotions(*tx, now, expired));
  assert(expired >= 1);
  tx->Commit();

  auto read   = repo.Begin();
  auto a      = repo.GetPromotion(*read, live.id);
  auto b      = repo.GetPromotion(*read, stale.id);
  assert(a->status == PromotionStatus::kRedeemed);
  assert(a->redeemed_at_ms == now);
  assert(a->redeemed_reservation_id == reservation);
  assert(a->redeemed_payment_id == 4242u);
  assert(b->status == PromotionStatus::kExpired);
  assert(repo.ListPromotions(*read, s.Customer()).size() == 2);
  read->Rollback();
}

void VerifyMembershipsAndAccrualBookkeeping(Repository& repo, const Scope& s) {
  {
    auto                    tx = repo.Begin();
    model::MembershipRecord m;
    Require(repo.LockMembership(*tx, s.Customer(), s.Merchant(), m));
    assert(m.customer_id == s.Customer());
    assert(m.visits_count == 0);
    assert(m.total_visits_count == 0);
    m.visits_count       = 3;
    m.total_visits_count = 9;
    Require(repo.UpdateMembership(*tx, m));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto m  = repo.GetMembership(*tx, s.Customer(), s.Merchant());
    assert(m.has_value());
    assert(m->visits_count == 3);
    assert(m->total_visits_count == 9);

    // existing row is loaded, not reset
    model::MembershipRecord locked;
    Require(repo.LockMembership(*tx, s.Customer(), s.Merchant(), locked));
    assert(locked.visits_count == 3);

    assert(repo.ListMembershipsWithTotalVisits(*tx, s.Merchant(), 9).size() == 1);
    assert(repo.ListMembershipsWithTotalVisits(*tx, s.Merchant(), 10).empty());

    Require(repo.UpsertProgram(*tx, {s.Merchant(), 5, 10, "first", true}));
    Require(repo.UpsertProgram(*tx, {s.Merchant(), 4, 15, "second", true}));
    auto program = repo.FindActiveProgram(*tx, s.Merchant());
    assert(program.has_value());
    assert(program->target_visits == 4);
    assert(program->discount_pct == 15);
    assert(program->note == "second");
    tx->Commit();
  }

  const auto done     = InsertReservation(repo, s, s.Customer(), ReservationStatus::kCompleted, NowMs() - 60'000);
  const auto upcoming = InsertReservation(repo, s, s.Customer(), ReservationStatus::kCompleted, NowMs() + 60'000);
  const auto canceled = InsertReservation(repo, s, s.Customer(), ReservationStatus::kCanceled, NowMs() - 60'000);

  auto tx         = repo.Begin();
  auto candidates = repo.ListAccrualCandidates(*tx, NowMs(), 0);
  auto has        = [&](uint64_t id) {
    return std::any_of(candidates.begin(), candidates.end(), [&](const model::ReservationRecord& r) { return r.id == id; });
  };
  assert(has(done));
  assert(!has(upcoming));
  assert(!has(canceled));

  assert(repo.MarkLoyaltySeen(*tx, done, LoyaltySeen::kUnprocessed, LoyaltySeen::kProcessed));
  assert(!repo.MarkLoyaltySeen(*tx, done, LoyaltySeen::kUnprocessed, LoyaltySeen::kProcessed));

  uint64_t marked = 0;
  Require(repo.MarkCanceledLoyaltySeen(*tx, marked));
  assert(marked >= 1);
  assert(repo.GetReservation(*tx, canceled)->loyalty_seen == LoyaltySeen::kCanceledProcessed);

  Require(repo.UpsertProgram(*tx, {s.Merchant(), 4, 15, "off", false}));
  assert(!repo.FindActiveProgram(*tx, s.Merchant()).has_value());
  tx->Commit();
}

void VerifyNotificationInbox(Repository& repo, const Scope& s) {
  model::NotificationRecord n;
  n.recipient_id  = s.Customer();
  n.merchant_id   = s.Merchant();
  n.sender_email  = "desk@parity.example";
  n.category      = "LOYALTY_PROMO";
  n.message       = "Use PAR-ITY";
  n.promotion_id  = 77;
  n.promo_code    = "PAR-ITY";
  n.created_at_ms = NowMs();
  InTx(repo, [&](Transaction& tx) { Require(repo.InsertNotification(tx, n)); });
  assert(n.id != 0);

  auto tx    = repo.Begin();
  auto inbox = repo.ListNotifications(*tx, s.Customer());
  tx->Rollback();
  assert(inbox.size() == 1);
  assert(inbox[0].message == "Use PAR-ITY");
  assert(inbox[0].promotion_id == 77u);
  assert(!inbox[0].reservation_id.has_value());
}

void VerifyRollbackBehavior(Repository& repo, const Scope& s) {
  model::ReservationRecord r;
  r.customer_id = s.Customer();
  r.merchant_id = s.Merchant();
  r.created_at_ms = NowMs();
  {
    auto tx = repo.Begin();
    Require(repo.InsertReservation(*tx, r));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    model::RewardRecord reward;
    reward.customer_id = s.Other();
    reward.merchant_id = s.Merchant();
    reward.discount_pct = 5;
    Require(repo.InsertReward(*tx, reward));
  }

  auto tx = repo.Begin();
  assert(!repo.GetReservation(*tx, r.id).has_value());
  assert(repo.ListRewards(*tx, s.Other(), s.Merchant()).empty());
  tx->Rollback();
}

void VerifySettlementAndAccrualFlow(const std::shared_ptr<Repository>& repo, const Scope& s) {
  auto sink = std::make_shared<strands::testing::RecordingSink>();
  strands::core::SettlementEngine engine(repo, sink, "no-reply@strands");
  strands::loyalty::AccrualJob    job(repo, sink, "no-reply@strands");

  // two visits on a two-visit program mint one reward
  InTx(*repo, [&](Transaction& tx) { Require(repo->UpsertProgram(tx, {s.Merchant(), 2, 20, "flow", true})); });
  InTx(*repo, [&](Transaction& tx) {
    model::MembershipRecord m;
    Require(repo->LockMembership(tx, s.Customer(), s.Merchant(), m));
    m.visits_count = 0;
    Require(repo->UpdateMembership(tx, m));
  });
  const auto v1 = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kCompleted, NowMs() - 60'000);
  const auto v2 = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kCompleted, NowMs() - 60'000);

  std::optional<uint64_t> minted;
  for (auto id : {v1, v2}) {
    auto tx = repo->Begin();
    auto r  = repo->GetReservation(*tx, id);
    tx->Rollback();
    const auto outcome = job.ProcessReservation(*r, NowMs());
    assert(outcome.status == strands::loyalty::AccrualStatus::kProcessed);
    if (outcome.reward_id) minted = outcome.reward_id;
  }
  assert(minted.has_value());

  // the minted reward pays for a new booking
  const auto booking = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 86'400'000);
  InTx(*repo, [&](Transaction& tx) { Require(repo->InsertReservationService(tx, {booking, 1, s.Staff(), 10000, 60})); });

  strands::core::SettlementRequest req;
  req.customer_id        = s.Customer();
  req.instrument_id      = s.Card();
  req.billing_address_id = s.Address();
  req.amount             = "100.00";
  req.reservation_id     = booking;
  req.discount.reward_id = *minted;

  const auto result = engine.Settle(req);
  assert(result.amount_cents == 8000);
  assert(result.original_amount_cents == strands::util::Cents{10000});
  assert(result.booking_updated);

  auto tx = repo->Begin();
  assert(repo->GetReservation(*tx, booking)->status == ReservationStatus::kScheduled);
  assert(!repo->GetReward(*tx, *minted)->active);
  tx->Rollback();

  // the same reward cannot pay twice
  const auto second = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 86'400'000);
  req.reservation_id = second;
  bool rejected      = false;
  try {
    engine.Settle(req);
  } catch (const strands::util::Error& e) {
    rejected = e.Reason() == strands::util::RejectReason::kRewardNotEligible;
  }
  assert(rejected);

  // compensation freed the second slot
  auto check = repo->Begin();
  assert(!repo->GetReservation(*check, second).has_value());
  check->Rollback();
}

void VerifyRacingRedemption(const std::shared_ptr<Repository>& repo, const Scope& s) {
  auto sink = std::make_shared<strands::testing::RecordingSink>();
  strands::core::SettlementEngine engine(repo, sink, "no-reply@strands");

  model::RewardRecord reward;
  reward.customer_id   = s.Customer();
  reward.merchant_id   = s.Merchant();
  reward.discount_pct  = 10;
  reward.created_at_ms = NowMs();
  InTx(*repo, [&](Transaction& tx) { Require(repo->InsertReward(tx, reward)); });

  const auto a = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 86'400'000);
  const auto b = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kPending, NowMs() + 86'400'000);

  std::atomic<int> wins{0};
  std::atomic<int> losses{0};
  auto attempt = [&](uint64_t reservation_id) {
    strands::core::SettlementRequest req;
    req.customer_id        = s.Customer();
    req.instrument_id      = s.Card();
    req.billing_address_id = s.Address();
    req.amount             = "50";
    req.reservation_id     = reservation_id;
    req.discount.reward_id = reward.id;
    try {
      engine.Settle(req);
      ++wins;
    } catch (const strands::util::Error& e) {
      assert(e.Reason() == strands::util::RejectReason::kRewardNoLongerAvailable ||
             e.Reason() == strands::util::RejectReason::kRewardNotEligible);
      ++losses;
    }
  };

  std::thread t1(attempt, a);
  std::thread t2(attempt, b);
  t1.join();
  t2.join();

  assert(wins == 1);
  assert(losses == 1);

  auto tx = repo->Begin();
  assert(repo->ListPaymentsForReservation(*tx, a).size() + repo->ListPaymentsForReservation(*tx, b).size() == 1);
  tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const Scope& s) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  const auto id = InsertReservation(*repo, s, s.Customer(), ReservationStatus::kScheduled, NowMs() + 1000);

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetReservation(*tx, id);
  assert(r.has_value());
  assert(r->status == ReservationStatus::kScheduled);
  assert(repo->GetMerchant(*tx, s.Merchant()).has_value());
  tx->Rollback();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STRANDS_DB_SQLITE
void VerifySqliteOpensIntoMissingDirectory() {
  const auto root = std::filesystem::temp_directory_path() / ("strands_sqlite_dir_" + std::to_string(NowMs()));
  const auto path = root / "nested" / "settlement.db";
  {
    auto db = std::make_shared<strands::db::sqlite::SqliteDB>(path.string());
    strands::db::sql::RunMigrations(*db, strands::db::sql::SqliteSchema());
    strands::db::sqlite::SqliteRepository repo(db);
    SeedScope(repo, Scope{1});
  }
  assert(std::filesystem::exists(path));
  std::filesystem::remove_all(root);
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("strands_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<strands::db::sqlite::SqliteDB>(db_path);
    strands::db::sql::RunMigrations(*db, strands::db::sql::SqliteSchema());
    return std::make_shared<strands::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if STRANDS_DB_POSTGRES
void VerifyPoolWaitIsBounded(const std::string& conninfo) {
  auto pool = std::make_shared<strands::db::postgres::PgPool>(conninfo, 1, std::chrono::milliseconds(100));
  {
    auto held   = pool->Acquire();
    bool waited = false;
    try {
      pool->Acquire();
    } catch (const std::runtime_error&) {
      waited = true;
    }
    assert(waited);
  }
  // the returned connection is reused
  auto again = pool->Acquire();
  assert(again->is_open());
}

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STRANDS_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STRANDS_TEST_PG_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<strands::db::postgres::PgPool>(conninfo, 4);
    {
      strands::db::postgres::PgTransaction tx(pool);
      strands::db::sql::RunMigrations(tx, strands::db::sql::PostgresSchema());
      tx.Commit();
    }
    return std::make_shared<strands::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend, uint64_t run_base) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const Scope main{run_base};
  SeedScope(*repo, main);
  VerifyAccountsAndOwnership(*repo, main);
  VerifyReservationCas(*repo, main);
  VerifyPaymentAndRewardRedemption(*repo, main);
  VerifyPromotions(*repo, main);
  VerifyMembershipsAndAccrualBookkeeping(*repo, main);
  VerifyNotificationInbox(*repo, main);
  VerifyRollbackBehavior(*repo, main);

  const Scope flow{run_base + 100};
  SeedScope(*repo, flow);
  VerifySettlementAndAccrualFlow(repo, flow);

  const Scope race{run_base + 200};
  SeedScope(*repo, race);
  VerifyRacingRedemption(repo, race);

  repo.reset();
  VerifyRestartDurability(backend, main);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STRANDS_DB_SQLITE
  VerifySqliteOpensIntoMissingDirectory();
  backends.push_back(MakeSqliteFactory());
#endif

#if STRANDS_DB_POSTGRES
  bool postgres = false;
  try {
    backends.push_back(MakePostgresFactory());
    postgres = true;
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
  if (postgres) {
    VerifyPoolWaitIsBounded(std::getenv("STRANDS_TEST_PG_URI"));
  }
#endif

  // keeps ids of repeated runs against one postgres database apart
  const uint64_t run_base = (NowMs() % 1'000'000'000ULL) * 1000ULL;
  for (auto& backend : backends) {
    RunBackendSuite(backend, run_base);
  }

  std::cout << "strands_integration_repository_parity: pass\n";
  return 0;
}
