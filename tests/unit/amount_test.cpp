#include "internal/model/amount.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using atomicswap::model::Amount;

bool RejectsText(const std::string& text) {
  try {
    (void)Amount::Parse(text);
  } catch (const atomicswap::util::Validation&) {
    return true;
  }
  return false;
}

void TestParseAndCanonicalForm() {
  assert(Amount::Parse("1").Units() == Amount::kScale);
  assert(Amount::Parse("1.0").ToString() == "1");
  assert(Amount::Parse("100.00000001").ToString() == "100.00000001");
  assert(Amount::Parse("0.5").ToString() == "0.5");
  assert(Amount::Parse("0").IsZero());
}

void TestRejectsMalformedText() {
  assert(RejectsText(""));
  assert(RejectsText("-1"));
  assert(RejectsText("1.123456789"));
  assert(RejectsText("1.2.3"));
  assert(RejectsText("abc"));
  assert(RejectsText("."));
  assert(RejectsText("1e5"));
  assert(RejectsText("999999999999999999999"));
}

void TestParsePositive() {
  bool threw = false;
  try {
    (void)Amount::ParsePositive("0.00000000", "initiator_amount");
  } catch (const atomicswap::util::Validation& e) {
    threw = std::string(e.what()).find("initiator_amount") != std::string::npos;
  }
  assert(threw);
  assert(Amount::ParsePositive("0.00000001", "x").Units() == 1);
}

void TestArithmeticIsChecked() {
  auto a = Amount::Parse("2.5");
  a -= Amount::Parse("0.5");
  assert(a == Amount::Parse("2"));
  assert(Amount::Parse("1") < Amount::Parse("1.00000001"));

  bool threw = false;
  try {
    a -= Amount::Parse("3");
  } catch (const std::underflow_error&) {
    threw = true;
  }
  assert(threw);
  assert(a == Amount::Parse("2"));
}

} // namespace

int main() {
  TestParseAndCanonicalForm();
  TestRejectsMalformedText();
  TestParsePositive();
  TestArithmeticIsChecked();

  std::cout << "atomicswap_unit_amount: pass\n";
  return 0;
}
