#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"

namespace strands::core {

enum class ReleaseStatus {
  kReleased,    // the PENDING row was deleted
  kNothingHeld, // no PENDING row owned by the caller remained
  kFailed,      // the store rejected the delete; see error
};

std::string_view ToString(ReleaseStatus status);

struct ReleaseOutcome {
  ReleaseStatus status         = ReleaseStatus::kNothingHeld;
  uint64_t      reservation_id = 0;
  std::string   error;
};

/*
  ReservationReleaser

  Compensation for a settlement that did not commit: frees the slot
  held by a PENDING reservation. Runs in its own transaction, after the
  aborted one is gone, and only deletes a row that is still PENDING and
  still owned by the caller.

  Never throws. Failures are reported through ReleaseOutcome and logged;
  the caller's original error is what the client sees.
*/
class ReservationReleaser {
 public:
  explicit ReservationReleaser(std::shared_ptr<db::Repository> repository);

  ReleaseOutcome Release(uint64_t reservation_id, uint64_t customer_id, std::string_view cause) const;

 private:
  ReleaseOutcome TryRelease(uint64_t reservation_id, uint64_t customer_id) const;

  std::shared_ptr<db::Repository> repository_;
};

} // namespace strands::core
