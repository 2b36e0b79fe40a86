#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace strands::grpc {

namespace {

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace strands::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (dynamic_cast<const Unauthenticated*>(&e)) return ::grpc::StatusCode::UNAUTHENTICATED;
  if (dynamic_cast<const PermissionDenied*>(&e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (dynamic_cast<const NotFound*>(&e)) return ::grpc::StatusCode::NOT_FOUND;
  if (dynamic_cast<const InvalidState*>(&e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (dynamic_cast<const Conflict*>(&e)) return ::grpc::StatusCode::ABORTED;
  if (dynamic_cast<const ResourceExhausted*>(&e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;

  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = CodeFor(e);
  if (const auto* domain = dynamic_cast<const strands::util::Error*>(&e)) {
    return {code, e.what(), std::string(strands::util::ToString(domain->Reason()))};
  }
  // backend detail stays in the log
  return {code, "internal error"};
}

} // namespace strands::grpc
