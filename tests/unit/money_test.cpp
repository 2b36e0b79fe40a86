#include <cassert>
#include <iostream>
#include <random>

#include "internal/util/money.hpp"
#include "internal/util/promo_code.hpp"

namespace {

using namespace strands::util;

void TestParseAmountAcceptsPlainDecimals() {
  assert(ParseAmount("100") == Cents{10000});
  assert(ParseAmount("19.99") == Cents{1999});
  assert(ParseAmount("0.01") == Cents{1});
  assert(ParseAmount("-5") == Cents{-500});
  assert(ParseAmount("+5") == Cents{500});
  assert(ParseAmount(".5") == Cents{50});
  assert(ParseAmount("7.") == Cents{700});
}

void TestParseAmountRejectsGarbage() {
  assert(!ParseAmount(""));
  assert(!ParseAmount("abc"));
  assert(!ParseAmount("12abc"));
  assert(!ParseAmount("inf"));
  assert(!ParseAmount("nan"));
  assert(!ParseAmount("0x64"));
  assert(!ParseAmount(" 5"));
  assert(!ParseAmount("5 "));
  assert(!ParseAmount("1e3"));
  assert(!ParseAmount("1.2.3"));
  assert(!ParseAmount("-"));
  assert(!ParseAmount("."));
  assert(!ParseAmount("--5"));
}

void TestAmountsAboveTheCeilingAreRejected() {
  assert(ParseAmount("9000000000000") == Cents{900'000'000'000'000});
  assert(!ParseAmount("1000000000000000"));
  assert(!ParseAmount("-1000000000000000"));
}

void TestApplyDiscountAtTheCeiling() {
  assert(ApplyDiscount(kMaximumAmountCents, 2000) == Cents{737'869'762'948'382});
  assert(ApplyDiscount(kMaximumAmountCents, 0) == kMaximumAmountCents);
  assert(ApplyDiscount(kMaximumAmountCents, kFullDiscountBps) == 0);
  assert(ApplyDiscount(100'000'000'000'000'000, 2000) == Cents{80'000'000'000'000'000});
}

void TestSubCentAmountsRoundToZero() {
  auto value = ParseDecimal("0.004");
  assert(value.has_value());
  assert(*value > 0);
  assert(ToCents(*value) == Cents{0});
}

void TestApplyDiscountRoundsHalfUp() {
  assert(ApplyDiscount(10000, 2000) == 8000);
  assert(ApplyDiscount(1999, 1250) == 1749);
  assert(ApplyDiscount(5, 5000) == 3); // 2.5 -> 3
  assert(ApplyDiscount(10000, 0) == 10000);
  assert(ApplyDiscount(10000, kFullDiscountBps) == 0);
}

void TestFormatting() {
  assert(FormatCents(8000) == "80.00");
  assert(FormatCents(1) == "0.01");
  assert(FormatCents(123456) == "1234.56");
  assert(FormatPercent(2000) == "20");
  assert(FormatPercent(1250) == "12.5");
  assert(FormatPercent(1225) == "12.25");
  assert(FormatPercent(5) == "0.05");
  assert(PercentToBps(12.5) == BasisPoints{1250});
}

void TestPromoCodes() {
  std::mt19937_64 rng(42);
  for (int i = 0; i < 100; ++i) {
    assert(IsWellFormedPromoCode(GeneratePromoCode(rng)));
  }
  assert(NormalizePromoCode("  k7m-q2x\n") == "K7M-Q2X");
  assert(!IsWellFormedPromoCode("K7M-Q2O")); // O is not in the alphabet
  assert(!IsWellFormedPromoCode("K7MQ2X"));
}

} // namespace

int main() {
  TestParseAmountAcceptsPlainDecimals();
  TestParseAmountRejectsGarbage();
  TestAmountsAboveTheCeilingAreRejected();
  TestApplyDiscountAtTheCeiling();
  TestSubCentAmountsRoundToZero();
  TestApplyDiscountRoundsHalfUp();
  TestFormatting();
  TestPromoCodes();

  std::cout << "strands_unit_money: pass\n";
  return 0;
}
