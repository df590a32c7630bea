#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace atomicswap::util {

/*
  Parses config durations such as "500ms", "30s", "15m", "12h", "1d".

  A bare integer is taken as seconds. Throws std::invalid_argument on
  anything else.
*/
std::chrono::milliseconds ParseDuration(std::string_view text);

// Same as ParseDuration but returns fallback when text is empty.
std::chrono::milliseconds ParseDurationOr(std::string_view text, std::chrono::milliseconds fallback);

std::string FormatDuration(std::chrono::milliseconds d);

} // namespace atomicswap::util
