#include "duration.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace atomicswap::util {
namespace {

std::int64_t UnitMillis(std::string_view unit) {
  if (unit == "ms") return 1;
  if (unit.empty() || unit == "s") return 1000;
  if (unit == "m") return 60LL * 1000;
  if (unit == "h") return 60LL * 60 * 1000;
  if (unit == "d") return 24LL * 60 * 60 * 1000;
  return 0;
}

} // namespace

std::chrono::milliseconds ParseDuration(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

  const std::size_t digits_begin = pos;
  std::int64_t      value        = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    const int digit = text[pos] - '0';
    if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
      throw std::invalid_argument("duration out of range: " + std::string(text));
    }
    value = value * 10 + digit;
    ++pos;
  }
  if (pos == digits_begin) {
    throw std::invalid_argument("invalid duration: '" + std::string(text) + "'");
  }

  std::size_t end = text.size();
  while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

  const auto unit       = text.substr(pos, end - pos);
  const auto multiplier = UnitMillis(unit);
  if (multiplier == 0) {
    throw std::invalid_argument("invalid duration unit '" + std::string(unit) + "' in '" + std::string(text) + "'");
  }
  if (value > std::numeric_limits<std::int64_t>::max() / multiplier) {
    throw std::invalid_argument("duration out of range: " + std::string(text));
  }

  return std::chrono::milliseconds(value * multiplier);
}

std::chrono::milliseconds ParseDurationOr(std::string_view text, std::chrono::milliseconds fallback) {
  if (text.empty()) {
    return fallback;
  }
  return ParseDuration(text);
}

std::string FormatDuration(std::chrono::milliseconds d) {
  const auto ms = d.count();
  if (ms != 0 && ms % (60LL * 60 * 1000) == 0) return std::to_string(ms / (60LL * 60 * 1000)) + "h";
  if (ms != 0 && ms % (60LL * 1000) == 0) return std::to_string(ms / (60LL * 1000)) + "m";
  if (ms % 1000 == 0) return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

} // namespace atomicswap::util
