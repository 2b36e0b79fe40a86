#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "discount_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_sink.hpp"
#include "reservation_releaser.hpp"

namespace strands::core {

struct SettlementRequest {
  uint64_t customer_id        = 0;
  uint64_t instrument_id      = 0;
  uint64_t billing_address_id = 0;

  // Decimal text as entered, e.g. "100" or "99.995".
  std::string amount;

  // Exactly one of the two.
  std::optional<uint64_t> reservation_id;
  std::optional<uint64_t> order_id;

  // Merchant of an order purchase; 0 when not supplied.
  uint64_t merchant_id = 0;

  DiscountRequest discount;
};

struct SettlementResult {
  uint64_t    payment_id   = 0;
  util::Cents amount_cents = 0;

  // Set only when a discount applied.
  std::optional<util::Cents> original_amount_cents;

  DiscountKind      discount_kind = DiscountKind::kNone;
  util::BasisPoints discount_bps  = 0;

  std::optional<uint64_t> reward_id;
  std::optional<uint64_t> promotion_id;

  bool booking_updated = false;
};

/*
  SettlementEngine

  Turns a PENDING reservation (or an order reference) into a recorded
  payment, redeeming at most one discount, in one transaction:

    1. insert the payment
    2. redeem the reward            (conditional, exactly one row)
    3. redeem the promotion         (conditional, exactly one row)
    4. reservation PENDING -> SCHEDULED (conditional, exactly one row)

  Any failure rolls the whole unit back. When a reservation is involved
  and the failure was not about the reservation itself, the releaser
  then frees the slot in a separate transaction.

  Notifications go out only after commit and never fail a settlement.
*/
class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::NotificationSink> sink,
                   std::string default_sender_email);

  SettlementResult Settle(const SettlementRequest& request);

 private:
  SettlementResult SettleInTransaction(db::Transaction& tx, const SettlementRequest& request, util::Cents requested_cents,
                                       std::optional<uint64_t>&                     release_reservation_id,
                                       std::optional<db::model::ReservationRecord>& settled_reservation);

  // Reads in its own transaction after commit; failures are logged and yield no notices.
  std::vector<notify::NotificationRequest> CollectNotifications(const SettlementRequest&                           request,
                                                                const std::optional<db::model::ReservationRecord>& reservation,
                                                                const SettlementResult&                            result);

  std::vector<notify::NotificationRequest> BuildNotifications(db::Transaction& tx, const SettlementRequest& request,
                                                              const db::model::ReservationRecord* reservation,
                                                              uint64_t merchant_id, const SettlementResult& result);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<notify::NotificationSink> sink_;
  DiscountResolver                         resolver_;
  ReservationReleaser                      releaser_;
  std::string                              default_sender_email_;
};

} // namespace strands::core
