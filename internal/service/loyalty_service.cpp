#include "loyalty_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace strands::service {

using namespace strands::settlement::v1;

LoyaltyService::LoyaltyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListRewardsResponse LoyaltyService::ListRewards(uint64_t caller_id, const ListRewardsRequest& req) {
  return ObserveRpc("LoyaltyService.ListRewards", caller_id, [&] {
    RequireCaller(caller_id);
    if (req.merchant_id() == 0) {
      throw util::InvalidArgument(util::RejectReason::kMissingField, "merchant_id is required");
    }

    auto tx      = ctx_.repository->Begin();
    auto rewards = ctx_.repository->ListRewards(*tx, caller_id, req.merchant_id());
    tx->Rollback();

    ListRewardsResponse resp;
    for (const auto& record : rewards) {
      auto* reward = resp.add_rewards();
      reward->set_reward_id(record.id);
      reward->set_merchant_id(record.merchant_id);
      reward->set_discount_percentage(record.discount_pct);
      reward->set_note(record.note);
      reward->set_active(record.State() == strands::model::RewardState::kAvailable);
      *reward->mutable_created_at() = util::MillisToProto(record.created_at_ms);
      if (record.redeemed_at_ms) {
        *reward->mutable_redeemed_at() = util::MillisToProto(*record.redeemed_at_ms);
      }
    }
    return resp;
  });
}

} // namespace strands::service
