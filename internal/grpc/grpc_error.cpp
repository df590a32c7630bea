#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace atomicswap::grpc {
namespace {

template <typename E>
bool Is(const std::exception& e) {
  return dynamic_cast<const E*>(&e) != nullptr;
}

struct CodeMapping {
  bool (*matches)(const std::exception&);
  ::grpc::StatusCode code;
};

constexpr CodeMapping kCodeMappings[] = {
    {&Is<util::Validation>, ::grpc::StatusCode::INVALID_ARGUMENT},
    {&Is<util::NotFound>, ::grpc::StatusCode::NOT_FOUND},
    {&Is<util::AlreadyExists>, ::grpc::StatusCode::ALREADY_EXISTS},
    {&Is<util::InvalidState>, ::grpc::StatusCode::FAILED_PRECONDITION},
    {&Is<util::TimelockNotExpired>, ::grpc::StatusCode::OUT_OF_RANGE},
    {&Is<util::BackendUnavailable>, ::grpc::StatusCode::UNAVAILABLE},
    {&Is<util::BackendRejected>, ::grpc::StatusCode::ABORTED},
};

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  for (const auto& mapping : kCodeMappings) {
    if (mapping.matches(e)) {
      return {mapping.code, e.what()};
    }
  }
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace atomicswap::grpc
