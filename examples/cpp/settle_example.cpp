#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <iostream>
#include <string>

#include "client/cpp/settlement_client.h"
#include "strands/settlement/v1.hpp"

// Usage: settle_example <target> <user_id> <reservation_id> <instrument_id> <billing_address_id> <amount> [promo_code]
int main(int argc, char** argv) {
  if (argc < 7) {
    std::cerr << "Usage: settle_example <target> <user_id> <reservation_id> <instrument_id> <billing_address_id> <amount> [promo_code]\n";
    return 1;
  }

  const std::string target  = argv[1];
  const uint64_t    user_id = std::stoull(argv[2]);

  strands::settlement::client::SettlementClient client(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()), user_id);

  strands::settlement::v1::SettlePaymentRequest request;
  request.set_reservation_id(std::stoull(argv[3]));
  request.set_instrument_id(std::stoull(argv[4]));
  request.set_billing_address_id(std::stoull(argv[5]));
  request.set_amount(argv[6]);
  if (argc > 7) {
    request.set_promo_code(argv[7]);
  }

  // Preview first so the caller sees what the code is worth.
  if (!request.promo_code().empty()) {
    strands::settlement::v1::PreviewPromotionRequest preview_request;
    preview_request.set_code(request.promo_code());
    preview_request.set_reservation_id(request.reservation_id());

    strands::settlement::v1::PreviewPromotionResponse preview;
    const auto status = client.PreviewPromotion(preview_request, &preview);
    if (!status.ok()) {
      std::cerr << "PreviewPromotion failed: " << status.error_message() << " ("
                << strands::settlement::client::SettlementClient::RejectReason(status) << ")\n";
      return 1;
    }
    std::cout << "promo " << preview.promotion().code() << ": " << preview.original_total() << " -> " << preview.discounted_total()
              << '\n';
  }

  strands::settlement::v1::SettlePaymentResponse response;
  const auto status = client.SettlePayment(request, &response);
  if (!status.ok()) {
    std::cerr << "SettlePayment failed: " << status.error_message() << " ("
              << strands::settlement::client::SettlementClient::RejectReason(status) << ")\n";
    return 1;
  }

  std::cout << "payment_id=" << response.payment_id() << " amount=" << response.amount();
  if (!response.original_amount().empty()) {
    std::cout << " original_amount=" << response.original_amount() << " discount=" << response.discount_percentage() << '%';
  }
  std::cout << " booking_updated=" << (response.booking_updated() ? "true" : "false") << '\n';
  return 0;
}
