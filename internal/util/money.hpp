#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace strands::util {

/*
  Money is carried as integer cents end to end. Discount percentages
  are carried as basis points (1/100 of a percent) so that a two
  decimal promotion rate such as 12.50% stays exact.
*/

using Cents       = std::int64_t;
using BasisPoints = std::int32_t;

constexpr Cents       kMinimumChargeCents = 1;
constexpr BasisPoints kFullDiscountBps    = 10'000;

// Largest accepted amount; any discount applied to it stays in range.
constexpr Cents kMaximumAmountCents = std::numeric_limits<Cents>::max() / kFullDiscountBps;

// Strict decimal parse: the whole text must be [+-]digits[.digits].
// No whitespace, exponent, hex or inf/nan forms.
std::optional<double> ParseDecimal(std::string_view text);

// Rounds half away from zero to the cent. nullopt beyond kMaximumAmountCents.
std::optional<Cents> ToCents(double value);

// ParseDecimal followed by ToCents. Sign is preserved so the caller can
// reject it.
std::optional<Cents> ParseAmount(std::string_view text);

// Rounds a percentage such as 12.5 to basis points.
std::optional<BasisPoints> PercentToBps(double percent);

// amount * (1 - bps / 10000), rounded half-up to the cent. amount >= 0,
// 0 <= bps <= 10000.
Cents ApplyDiscount(Cents amount, BasisPoints bps);

std::string FormatCents(Cents amount);
std::string FormatPercent(BasisPoints bps);

} // namespace strands::util
