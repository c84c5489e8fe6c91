#include "rpc_error.hpp"

#include "internal/util/errors.hpp"

namespace bolt::rpc {

void ThrowConnectError(const ::grpc::Status& status) {
  const auto& message = status.error_message();

  switch (status.error_code()) {
    case ::grpc::StatusCode::UNIMPLEMENTED:
      throw util::UnimplementedError(message);
    case ::grpc::StatusCode::UNAVAILABLE:
      throw util::UnavailableError(message);
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::PERMISSION_DENIED:
      throw util::MacaroonError(message);
    default:
      throw util::HostUnreachableError(message);
  }
}

} // namespace bolt::rpc
