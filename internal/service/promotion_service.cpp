#include "promotion_service.hpp"

#include "internal/core/promotion_issuer.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace strands::service {

using namespace strands::settlement::v1;

namespace {

PromotionStatus ToProto(strands::model::PromotionStatus status) {
  switch (status) {
    case strands::model::PromotionStatus::kIssued:
      return PROMOTION_STATUS_ISSUED;
    case strands::model::PromotionStatus::kRedeemed:
      return PROMOTION_STATUS_REDEEMED;
    case strands::model::PromotionStatus::kExpired:
      return PROMOTION_STATUS_EXPIRED;
  }
  return PROMOTION_STATUS_UNSPECIFIED;
}

Promotion ToProto(const db::model::PromotionRecord& record) {
  Promotion out;
  out.set_promotion_id(record.id);
  out.set_merchant_id(record.merchant_id);
  out.set_code(record.code);
  out.set_description(record.description);
  out.set_discount_percentage(util::FormatPercent(record.discount_bps));
  out.set_status(ToProto(record.status));
  *out.mutable_issued_at() = util::MillisToProto(record.issued_at_ms);
  if (record.expires_at_ms) *out.mutable_expires_at() = util::MillisToProto(*record.expires_at_ms);
  if (record.redeemed_at_ms) *out.mutable_redeemed_at() = util::MillisToProto(*record.redeemed_at_ms);
  return out;
}

std::optional<uint64_t> ExpiryFromProto(bool has_expiry, const google::protobuf::Timestamp& ts) {
  if (!has_expiry) {
    return std::nullopt;
  }
  return util::ProtoToMillis(ts);
}

} // namespace

PromotionService::PromotionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IssuePromotionResponse PromotionService::IssuePromotion(uint64_t caller_id, const IssuePromotionRequest& req) {
  return ObserveRpc("PromotionService.IssuePromotion", caller_id, [&] {
    RequireCaller(caller_id);

    core::IssuePromotionRequest issue;
    issue.owner_user_id       = caller_id;
    issue.merchant_id         = req.merchant_id();
    issue.customer_id         = req.customer_id();
    issue.description         = req.description();
    issue.discount_percentage = req.discount_percentage();
    issue.expires_at_ms       = ExpiryFromProto(req.has_expires_at(), req.expires_at());

    const auto issued = ctx_.promotions->Issue(issue);

    IssuePromotionResponse resp;
    *resp.mutable_promotion() = ToProto(issued.promotion);
    resp.set_notification_id(issued.notification_id);
    return resp;
  });
}

IssueLoyalCustomerPromotionsResponse PromotionService::IssueLoyalCustomerPromotions(uint64_t caller_id,
                                                                                    const IssueLoyalCustomerPromotionsRequest& req) {
  return ObserveRpc("PromotionService.IssueLoyalCustomerPromotions", caller_id, [&] {
    RequireCaller(caller_id);

    core::LoyalCustomerIssueRequest issue;
    issue.owner_user_id       = caller_id;
    issue.merchant_id         = req.merchant_id();
    issue.description         = req.description();
    issue.discount_percentage = req.discount_percentage();
    issue.expires_at_ms       = ExpiryFromProto(req.has_expires_at(), req.expires_at());
    issue.min_total_visits    = req.min_total_visits();

    const auto report = ctx_.promotions->IssueToLoyalCustomers(issue);

    IssueLoyalCustomerPromotionsResponse resp;
    resp.set_eligible(report.eligible);
    resp.set_issued(report.issued);
    resp.set_failed(report.failed);
    return resp;
  });
}

ListPromotionsResponse PromotionService::ListPromotions(uint64_t caller_id, const ListPromotionsRequest&) {
  return ObserveRpc("PromotionService.ListPromotions", caller_id, [&] {
    RequireCaller(caller_id);

    ListPromotionsResponse resp;
    for (const auto& promo : ctx_.promotions->List(caller_id)) {
      *resp.add_promotions() = ToProto(promo);
    }
    return resp;
  });
}

PreviewPromotionResponse PromotionService::PreviewPromotion(uint64_t caller_id, const PreviewPromotionRequest& req) {
  return ObserveRpc("PromotionService.PreviewPromotion", caller_id, [&] {
    RequireCaller(caller_id);

    const auto preview = ctx_.promotions->Preview(caller_id, req.code(), req.reservation_id());

    PreviewPromotionResponse resp;
    *resp.mutable_promotion() = ToProto(preview.promotion);
    resp.set_original_total(util::FormatCents(preview.original_total));
    resp.set_discount_amount(util::FormatCents(preview.discount_amount));
    resp.set_discounted_total(util::FormatCents(preview.discounted_total));
    return resp;
  });
}

} // namespace strands::service
