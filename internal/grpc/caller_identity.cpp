#include "caller_identity.hpp"

#include <charconv>
#include <string_view>

#include "internal/util/errors.hpp"

namespace strands::grpc {

uint64_t CallerId(const ::grpc::ServerContext& ctx) {
  const auto& metadata = ctx.client_metadata();
  const auto  it       = metadata.find(kCallerIdMetadataKey);
  if (it == metadata.end()) {
    throw strands::util::Unauthenticated("Unauthorized");
  }

  const std::string_view text(it->second.data(), it->second.size());
  uint64_t               id = 0;
  const auto [end, ec]      = std::from_chars(text.data(), text.data() + text.size(), id);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size() || id == 0) {
    throw strands::util::Unauthenticated("Unauthorized");
  }
  return id;
}

} // namespace strands::grpc
