#pragma once

#include <cstdint>
#include <string>

namespace strands::db::model {

// A salon. Promotions are issued by its owner.
struct MerchantRecord {
  uint64_t    id            = 0;
  uint64_t    owner_user_id = 0;
  std::string name;
  std::string sender_email;
};

/*
  Ownership stubs for stored payment instruments and billing
  addresses. Card data and address fields live with the profile
  component; settlement only needs to know who owns the row.
*/

struct InstrumentRecord {
  uint64_t id      = 0;
  uint64_t user_id = 0;
};

struct BillingAddressRecord {
  uint64_t id      = 0;
  uint64_t user_id = 0;
};

} // namespace strands::db::model
