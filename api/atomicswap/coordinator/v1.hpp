#pragma once

#include "atomicswap/coordinator/v1/types.pb.h"

#include "atomicswap/coordinator/v1/coordinator_service.pb.h"
#include "atomicswap/coordinator/v1/coordinator_service.grpc.pb.h"
