#pragma once

#include <cstdint>
#include <grpcpp/grpcpp.h>

namespace strands::grpc {

// Metadata key carrying the authenticated user id, set by the edge proxy.
inline constexpr char kCallerIdMetadataKey[] = "x-strands-user-id";

// Throws util::Unauthenticated when the key is missing, empty, zero or
// not a plain decimal number.
uint64_t CallerId(const ::grpc::ServerContext& ctx);

} // namespace strands::grpc
