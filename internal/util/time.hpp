#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"
#include "internal/util/clock.hpp"

namespace atomicswap::util {

// Swap instants are stored and exposed at one-second resolution.
TimePoint    TruncateToSeconds(TimePoint tp);
std::int64_t ToUnixSeconds(TimePoint tp);
TimePoint    FromUnixSeconds(std::int64_t seconds);

// Sub-second parts are dropped.
google::protobuf::Timestamp ToProto(TimePoint tp);

} // namespace atomicswap::util
