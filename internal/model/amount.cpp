#include "amount.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace atomicswap::model {
namespace {

constexpr std::uint64_t kMaxUnits = std::numeric_limits<std::uint64_t>::max();

[[noreturn]] void Malformed(std::string_view text, std::string_view why) {
  throw util::Validation("invalid amount '" + std::string(text) + "': " + std::string(why));
}

} // namespace

Amount Amount::Parse(std::string_view text) {
  if (text.empty()) {
    Malformed(text, "empty");
  }
  if (text.front() == '-') {
    Malformed(text, "negative");
  }

  std::uint64_t whole     = 0;
  std::uint64_t fraction  = 0;
  int           frac_len  = 0;
  bool          seen_dot  = false;
  bool          any_digit = false;

  for (char c : text) {
    if (c == '.') {
      if (seen_dot) Malformed(text, "more than one decimal point");
      seen_dot = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      Malformed(text, "unexpected character");
    }
    any_digit       = true;
    const int digit = c - '0';
    if (seen_dot) {
      if (++frac_len > kScaleDigits) Malformed(text, "more than 8 fractional digits");
      fraction = fraction * 10 + static_cast<std::uint64_t>(digit);
    } else {
      if (whole > (kMaxUnits / kScale - static_cast<std::uint64_t>(digit)) / 10) Malformed(text, "too large");
      whole = whole * 10 + static_cast<std::uint64_t>(digit);
    }
  }
  if (!any_digit) {
    Malformed(text, "no digits");
  }

  for (int i = frac_len; i < kScaleDigits; ++i) {
    fraction *= 10;
  }
  if (whole * kScale > kMaxUnits - fraction) {
    Malformed(text, "too large");
  }
  return FromUnits(whole * kScale + fraction);
}

Amount Amount::ParsePositive(std::string_view text, std::string_view field) {
  Amount amount = Parse(text);
  if (amount.IsZero()) {
    throw util::Validation(std::string(field) + " must be positive");
  }
  return amount;
}

std::string Amount::ToString() const {
  std::string out = std::to_string(units_ / kScale);

  auto frac = units_ % kScale;
  if (frac == 0) {
    return out;
  }

  std::string digits(kScaleDigits, '0');
  for (int i = kScaleDigits - 1; i >= 0; --i) {
    digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + frac % 10);
    frac /= 10;
  }
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  return out + "." + digits;
}

Amount& Amount::operator+=(const Amount& other) {
  if (units_ > kMaxUnits - other.units_) {
    throw std::overflow_error("amount overflow");
  }
  units_ += other.units_;
  return *this;
}

Amount& Amount::operator-=(const Amount& other) {
  if (other.units_ > units_) {
    throw std::underflow_error("amount underflow");
  }
  units_ -= other.units_;
  return *this;
}

} // namespace atomicswap::model
