#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace atomicswap::grpc {

// Status for an exception escaping a handler. The message is e.what(); types
// outside util/errors.hpp become INTERNAL.
::grpc::Status ToStatus(const std::exception& e);

} // namespace atomicswap::grpc
