#include "promotion_expiry.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace strands::loyalty {

PromotionExpirySweep::PromotionExpirySweep(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("PromotionExpirySweep requires a repository");
  }
}

uint64_t PromotionExpirySweep::Run(uint64_t now_ms) {
  uint64_t expired = 0;

  auto tx = repository_->Begin();
  auto r  = repository_->ExpirePromotions(*tx, now_ms, expired);
  if (!r) {
    tx->Rollback();
    throw std::runtime_error("expire promotions: " + r.message);
  }
  tx->Commit();

  if (expired > 0) {
    STRANDS_LOG_INFO("promotions expired", {observability::UIntField("count", expired)});
  }
  observability::Metrics::Instance().RecordSweepItems("promotion_expiry", "expired", expired);
  return expired;
}

} // namespace strands::loyalty
