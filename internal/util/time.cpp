#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace atomicswap::util {

TimePoint TruncateToSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp);
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(std::int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  return google::protobuf::util::TimeUtil::SecondsToTimestamp(ToUnixSeconds(tp));
}

} // namespace atomicswap::util
