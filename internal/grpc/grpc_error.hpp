#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace strands::grpc {

/*
  Converts internal exceptions into gRPC status codes.
  The reject reason name travels in error_details.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace strands::grpc
