#pragma once

#include "atomicswap/coordinator/v1.hpp"
#include "internal/db/model/swap_record.hpp"

namespace atomicswap::service {

/*
  Record <-> wire conversions.

  ToProto never copies the secret; SwapOffer has no field for it.
*/

atomicswap::coordinator::v1::SwapOffer  ToProto(const db::model::SwapRecord& swap);
atomicswap::coordinator::v1::SwapStatus ToProto(atomicswap::model::SwapStatus status);
atomicswap::model::SwapStatus           FromProto(atomicswap::coordinator::v1::SwapStatus status);

} // namespace atomicswap::service
