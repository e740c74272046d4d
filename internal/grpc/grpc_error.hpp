#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace brewmon::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace brewmon::grpc
