#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "discount_resolver.hpp"
#include "internal/db/api/repository.hpp"

namespace strands::core {

inline constexpr int kPromoCodeAttempts = 5;

struct IssuePromotionRequest {
  uint64_t    owner_user_id = 0; // caller; must own the merchant
  uint64_t    merchant_id   = 0;
  uint64_t    customer_id   = 0;
  std::string description;
  std::string discount_percentage; // decimal text, two fractional digits kept
  std::optional<uint64_t> expires_at_ms;
};

struct IssuedPromotion {
  db::model::PromotionRecord promotion;
  uint64_t                   notification_id = 0;
};

struct LoyalCustomerIssueRequest {
  uint64_t    owner_user_id = 0;
  uint64_t    merchant_id   = 0;
  std::string description;
  std::string discount_percentage;
  std::optional<uint64_t> expires_at_ms;
  uint32_t    min_total_visits = 0; // 0 = configured default
};

struct LoyalCustomerIssueReport {
  uint32_t eligible = 0;
  uint32_t issued   = 0;
  uint32_t failed   = 0;
};

struct PromotionPreview {
  db::model::PromotionRecord promotion;
  util::Cents                original_total   = 0;
  util::Cents                discount_amount  = 0;
  util::Cents                discounted_total = 0;
};

/*
  PromotionIssuer

  Merchant-side promotion lifecycle: issue a customer-targeted code,
  issue to every loyal member in bulk, list a customer's codes, and
  price a code against a reservation without redeeming it.

  Each issued code and its LOYALTY_PROMO inbox row are written in the
  same transaction.
*/
class PromotionIssuer {
 public:
  using CodeGenerator = std::function<std::string()>;

  PromotionIssuer(std::shared_ptr<db::Repository> repository, std::string default_sender_email, uint32_t default_min_total_visits,
                  CodeGenerator generator = {});

  IssuedPromotion Issue(const IssuePromotionRequest& request);

  LoyalCustomerIssueReport IssueToLoyalCustomers(const LoyalCustomerIssueRequest& request);

  // Status is the effective one: past-expiry codes read as EXPIRED.
  std::vector<db::model::PromotionRecord> List(uint64_t customer_id);

  PromotionPreview Preview(uint64_t customer_id, std::string_view code, uint64_t reservation_id);

 private:
  struct Terms {
    std::string             description;
    util::BasisPoints       bps = 0;
    std::optional<uint64_t> expires_at_ms;
  };

  Terms ValidateTerms(const std::string& description, const std::string& percentage, std::optional<uint64_t> expires_at_ms,
                      uint64_t now_ms) const;

  db::model::MerchantRecord RequireOwnedMerchant(db::Transaction& tx, uint64_t owner_user_id, uint64_t merchant_id) const;

  IssuedPromotion IssueWithin(db::Transaction& tx, const db::model::MerchantRecord& merchant, uint64_t customer_id, const Terms& terms,
                              uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  DiscountResolver                resolver_;
  std::string                     default_sender_email_;
  uint32_t                        default_min_total_visits_;
  CodeGenerator                   generator_;
};

} // namespace strands::core
