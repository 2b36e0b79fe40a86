#include "reservation_releaser.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace strands::core {

std::string_view ToString(ReleaseStatus status) {
  switch (status) {
    case ReleaseStatus::kReleased:
      return "released";
    case ReleaseStatus::kNothingHeld:
      return "nothing_held";
    case ReleaseStatus::kFailed:
      return "failed";
  }
  return "failed";
}

ReservationReleaser::ReservationReleaser(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("ReservationReleaser requires a repository");
  }
}

ReleaseOutcome ReservationReleaser::Release(uint64_t reservation_id, uint64_t customer_id, std::string_view cause) const {
  ReleaseOutcome outcome;
  try {
    outcome = TryRelease(reservation_id, customer_id);
  } catch (const std::exception& e) {
    outcome.status         = ReleaseStatus::kFailed;
    outcome.reservation_id = reservation_id;
    outcome.error          = e.what();
  }

  if (outcome.status == ReleaseStatus::kFailed) {
    STRANDS_LOG_ERROR("reservation release failed", {observability::UIntField("reservation_id", reservation_id),
                                                     observability::UIntField("customer_id", customer_id),
                                                     observability::StringField("cause", cause),
                                                     observability::StringField("error", outcome.error)});
  } else {
    STRANDS_LOG_INFO("reservation release", {observability::UIntField("reservation_id", reservation_id),
                                             observability::StringField("outcome", ToString(outcome.status)),
                                             observability::StringField("cause", cause)});
  }
  return outcome;
}

ReleaseOutcome ReservationReleaser::TryRelease(uint64_t reservation_id, uint64_t customer_id) const {
  ReleaseOutcome outcome;
  outcome.reservation_id = reservation_id;

  auto tx  = repository_->Begin();
  auto cas = repository_->DeletePendingReservation(*tx, reservation_id, customer_id);
  if (!cas.status) {
    tx->Rollback();
    outcome.status = ReleaseStatus::kFailed;
    outcome.error  = cas.status.message;
    return outcome;
  }
  tx->Commit();

  outcome.status = cas.swapped ? ReleaseStatus::kReleased : ReleaseStatus::kNothingHeld;
  return outcome;
}

} // namespace strands::core
