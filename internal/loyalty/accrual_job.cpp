#include "accrual_job.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "visit_counter.hpp"

namespace strands::loyalty {

using strands::model::LoyaltySeen;
using strands::model::ReservationStatus;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  throw std::runtime_error(result.message.empty() ? context : context + ": " + result.message);
}

} // namespace

std::string_view ToString(AccrualStatus status) {
  switch (status) {
    case AccrualStatus::kProcessed:
      return "processed";
    case AccrualStatus::kAlreadyProcessed:
      return "already_processed";
    case AccrualStatus::kFailed:
      return "failed";
  }
  return "failed";
}

AccrualJob::AccrualJob(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSink> sink,
                       std::string default_sender_email, std::size_t batch_limit)
    : repository_(std::move(repository)),
      sink_(std::move(sink)),
      default_sender_email_(std::move(default_sender_email)),
      batch_limit_(batch_limit) {
  if (!repository_ || !sink_) {
    throw std::invalid_argument("AccrualJob requires a repository and a notification sink");
  }
}

AccrualOutcome AccrualJob::ProcessReservation(const db::model::ReservationRecord& reservation, uint64_t now_ms) {
  AccrualOutcome                             outcome;
  std::optional<notify::NotificationRequest> earned;

  try {
    auto tx = repository_->Begin();
    outcome = ProcessInTransaction(*tx, reservation, now_ms, earned);
    if (outcome.status == AccrualStatus::kProcessed) {
      tx->Commit();
    } else {
      tx->Rollback();
    }
  } catch (const std::exception& e) {
    outcome                = AccrualOutcome{};
    outcome.reservation_id = reservation.id;
    outcome.status         = AccrualStatus::kFailed;
    outcome.error          = e.what();
    earned.reset();
  }

  if (earned) {
    notify::EmitBestEffort(*sink_, {*earned});
  }
  return outcome;
}

AccrualOutcome AccrualJob::ProcessInTransaction(db::Transaction& tx, const db::model::ReservationRecord& reservation, uint64_t now_ms,
                                                std::optional<notify::NotificationRequest>& earned) {
  AccrualOutcome outcome;
  outcome.reservation_id = reservation.id;

  const auto seen = strands::model::Next(LoyaltySeen::kUnprocessed, ReservationStatus::kCompleted);

  db::model::MembershipRecord membership;
  ThrowIfDbError(repository_->LockMembership(tx, reservation.customer_id, reservation.merchant_id, membership), "lock membership");

  auto           program = repository_->FindActiveProgram(tx, reservation.merchant_id);
  const uint32_t target  = program ? program->target_visits : 0;
  const auto     step    = ApplyVisit(membership.visits_count, target);

  membership.visits_count = step.visits_count;
  membership.total_visits_count += 1;
  ThrowIfDbError(repository_->UpdateMembership(tx, membership), "update membership");

  if (step.mint_reward) {
    db::model::RewardRecord reward;
    reward.customer_id   = reservation.customer_id;
    reward.merchant_id   = reservation.merchant_id;
    reward.discount_pct  = program->discount_pct;
    reward.note          = program->note;
    reward.active        = true;
    reward.created_at_ms = now_ms;
    ThrowIfDbError(repository_->InsertReward(tx, reward), "insert reward");
    outcome.reward_id = reward.id;

    std::string sender = default_sender_email_;
    if (auto merchant = repository_->GetMerchant(tx, reservation.merchant_id); merchant && !merchant->sender_email.empty()) {
      sender = merchant->sender_email;
    }

    notify::NotificationRequest note;
    note.recipient_id   = reservation.customer_id;
    note.merchant_id    = reservation.merchant_id;
    note.category       = notify::NotificationCategory::kRewardEarned;
    note.sender_email   = sender;
    note.reservation_id = reservation.id;
    note.message        = notify::RewardEarnedMessage(reward.discount_pct, reward.note);
    earned              = std::move(note);
  }

  auto cas = repository_->MarkLoyaltySeen(tx, reservation.id, LoyaltySeen::kUnprocessed, *seen);
  ThrowIfDbError(cas.status, "mark loyalty seen");
  if (!cas.swapped) {
    earned.reset();
    outcome.reward_id.reset();
    outcome.status = AccrualStatus::kAlreadyProcessed;
    return outcome;
  }

  outcome.status       = AccrualStatus::kProcessed;
  outcome.visits_count = membership.visits_count;
  return outcome;
}

uint64_t AccrualJob::MarkCanceled() {
  uint64_t affected = 0;
  auto     tx       = repository_->Begin();
  ThrowIfDbError(repository_->MarkCanceledLoyaltySeen(*tx, affected), "mark canceled reservations");
  tx->Commit();
  return affected;
}

SweepReport AccrualJob::RunSweep(uint64_t now_ms) {
  SweepReport report;

  std::vector<db::model::ReservationRecord> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->ListAccrualCandidates(*tx, now_ms, batch_limit_);
    tx->Rollback();
  }
  report.scanned = candidates.size();

  for (const auto& reservation : candidates) {
    const auto outcome = ProcessReservation(reservation, now_ms);
    switch (outcome.status) {
      case AccrualStatus::kProcessed:
        ++report.processed;
        if (outcome.reward_id) ++report.rewards_minted;
        break;
      case AccrualStatus::kAlreadyProcessed:
        ++report.skipped;
        break;
      case AccrualStatus::kFailed:
        ++report.failures;
        STRANDS_LOG_ERROR("loyalty accrual failed", {observability::UIntField("reservation_id", reservation.id),
                                                     observability::UIntField("customer_id", reservation.customer_id),
                                                     observability::UIntField("merchant_id", reservation.merchant_id),
                                                     observability::StringField("error", outcome.error)});
        break;
    }
  }

  try {
    report.canceled_marked = MarkCanceled();
  } catch (const std::exception& e) {
    ++report.failures;
    STRANDS_LOG_ERROR("loyalty canceled pass failed", {observability::StringField("error", e.what())});
  }

  STRANDS_LOG_INFO("loyalty sweep", {observability::UIntField("scanned", report.scanned),
                                     observability::UIntField("processed", report.processed),
                                     observability::UIntField("rewards_minted", report.rewards_minted),
                                     observability::UIntField("skipped", report.skipped),
                                     observability::UIntField("failures", report.failures),
                                     observability::UIntField("canceled_marked", report.canceled_marked)});

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSweepItems("loyalty_accrual", "processed", report.processed);
  metrics.RecordSweepItems("loyalty_accrual", "skipped", report.skipped);
  metrics.RecordSweepItems("loyalty_accrual", "failed", report.failures);
  metrics.RecordSweepItems("loyalty_accrual", "rewards_minted", report.rewards_minted);
  metrics.RecordSweepItems("loyalty_accrual", "canceled_marked", report.canceled_marked);
  return report;
}

} // namespace strands::loyalty
