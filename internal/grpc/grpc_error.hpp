#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace bolt::grpc {

/*
  Converts controller exceptions into gRPC status codes for the
  presentation boundary.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace bolt::grpc
