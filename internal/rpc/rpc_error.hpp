#pragma once

#include <grpcpp/grpcpp.h>

namespace bolt::rpc {

/*
  Maps a failed node-side gRPC status onto the ConnectError family.

  UNIMPLEMENTED                         -> UnimplementedError
  UNAVAILABLE                           -> UnavailableError
  UNAUTHENTICATED / PERMISSION_DENIED   -> MacaroonError
  anything else                         -> HostUnreachableError
*/
[[noreturn]] void ThrowConnectError(const ::grpc::Status& status);

} // namespace bolt::rpc
