#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_sink.hpp"

namespace strands::loyalty {

enum class AccrualStatus {
  kProcessed,
  kAlreadyProcessed, // another run marked it first; nothing written
  kFailed,
};

std::string_view ToString(AccrualStatus status);

struct AccrualOutcome {
  uint64_t      reservation_id = 0;
  AccrualStatus status         = AccrualStatus::kFailed;

  uint32_t                visits_count = 0;
  std::optional<uint64_t> reward_id;

  std::string error;
};

struct SweepReport {
  uint64_t scanned         = 0;
  uint64_t processed       = 0;
  uint64_t rewards_minted  = 0;
  uint64_t skipped         = 0;
  uint64_t failures        = 0;
  uint64_t canceled_marked = 0;
};

/*
  AccrualJob

  Turns completed visits into loyalty progress. Each reservation is
  handled in its own transaction:

    lock membership (created at zero) -> count visit -> load program
    -> maybe mint reward -> loyalty_seen 0 -> 1 (conditional)

  The membership row lock serializes concurrent runs for the same
  (customer, merchant). ProcessReservation never throws; a failure
  rolls back that reservation only and stays eligible for the next run.
*/
class AccrualJob {
 public:
  AccrualJob(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSink> sink,
             std::string default_sender_email, std::size_t batch_limit = 0);

  AccrualOutcome ProcessReservation(const db::model::ReservationRecord& reservation, uint64_t now_ms);

  SweepReport RunSweep(uint64_t now_ms);

 private:
  AccrualOutcome ProcessInTransaction(db::Transaction& tx, const db::model::ReservationRecord& reservation, uint64_t now_ms,
                                      std::optional<notify::NotificationRequest>& earned);

  uint64_t MarkCanceled();

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<notify::NotificationSink> sink_;
  std::string                              default_sender_email_;
  std::size_t                              batch_limit_;
};

} // namespace strands::loyalty
