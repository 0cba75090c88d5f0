#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace vaultsync::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace vaultsync::grpc
