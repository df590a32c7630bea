#include "internal/util/duration.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

using namespace std::chrono_literals;
using atomicswap::util::FormatDuration;
using atomicswap::util::ParseDuration;
using atomicswap::util::ParseDurationOr;

bool Rejects(const char* text) {
  try {
    (void)ParseDuration(text);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestUnits() {
  assert(ParseDuration("500ms") == 500ms);
  assert(ParseDuration("30s") == 30s);
  assert(ParseDuration("15m") == 15min);
  assert(ParseDuration("12h") == 12h);
  assert(ParseDuration("1d") == 24h);
  assert(ParseDuration("45") == 45s);
}

void TestMalformed() {
  assert(Rejects(""));
  assert(Rejects("h"));
  assert(Rejects("10 years"));
  assert(Rejects("-5s"));
  assert(Rejects("1.5h"));
}

void TestFallbackAndFormat() {
  assert(ParseDurationOr("", 7s) == 7s);
  assert(ParseDurationOr("2s", 7s) == 2s);
  assert(FormatDuration(12h) == "12h");
  assert(FormatDuration(90s) == "90s");
  assert(FormatDuration(250ms) == "250ms");
}

} // namespace

int main() {
  TestUnits();
  TestMalformed();
  TestFallbackAndFormat();

  std::cout << "atomicswap_unit_duration: pass\n";
  return 0;
}
