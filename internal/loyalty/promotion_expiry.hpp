#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace strands::loyalty {

/*
  Flips ISSUED promotions past their expiry to EXPIRED. Purely
  housekeeping: redemption checks expiry at use time regardless.
*/
class PromotionExpirySweep {
 public:
  explicit PromotionExpirySweep(std::shared_ptr<db::Repository> repository);

  // Returns the number of promotions expired. Throws on store failure.
  uint64_t Run(uint64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace strands::loyalty
