#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace atomicswap::model {

/*
  Exact decimal quantity of an asset.

  Stored as an unsigned count of 1e-8 units, so both assets share one
  representation and nothing ever passes through floating point.
  Text form is plain decimal ("1", "0.5", "100.00000001").
*/
class Amount {
 public:
  static constexpr int           kScaleDigits = 8;
  static constexpr std::uint64_t kScale       = 100000000ULL;

  constexpr Amount() = default;

  static constexpr Amount FromUnits(std::uint64_t units) {
    Amount a;
    a.units_ = units;
    return a;
  }

  // Throws util::Validation on malformed text, more than eight fractional
  // digits or overflow.
  static Amount Parse(std::string_view text);

  // Parse + rejects zero.
  static Amount ParsePositive(std::string_view text, std::string_view field);

  constexpr std::uint64_t Units() const {
    return units_;
  }

  constexpr bool IsZero() const {
    return units_ == 0;
  }

  // Canonical form, trailing fractional zeros dropped.
  std::string ToString() const;

  // Throws std::overflow_error / std::underflow_error.
  Amount& operator+=(const Amount& other);
  Amount& operator-=(const Amount& other);

  friend Amount operator+(Amount a, const Amount& b) {
    return a += b;
  }
  friend Amount operator-(Amount a, const Amount& b) {
    return a -= b;
  }

  friend constexpr auto operator<=>(const Amount&, const Amount&) = default;

 private:
  std::uint64_t units_ = 0;
};

} // namespace atomicswap::model
