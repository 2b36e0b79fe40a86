#include "money.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace strands::util {

namespace {

// [+-]? digits [. digits], or [+-]? . digits
bool IsPlainDecimal(std::string_view text) {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  std::size_t digits = 0;
  bool        dot    = false;
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c >= '0' && c <= '9') {
      ++digits;
    } else if (c == '.' && !dot) {
      dot = true;
    } else {
      return false;
    }
  }
  return digits > 0;
}

} // namespace

std::optional<double> ParseDecimal(std::string_view text) {
  if (!IsPlainDecimal(text)) {
    return std::nullopt;
  }

  // from_chars takes no leading '+'
  if (text.front() == '+') {
    text.remove_prefix(1);
  }

  double     value  = 0;
  const auto parsed = std::from_chars(text.data(), text.data() + text.size(), value, std::chars_format::fixed);
  if (parsed.ec != std::errc() || parsed.ptr != text.data() + text.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<Cents> ToCents(double value) {
  if (!std::isfinite(value) || std::fabs(value) * 100.0 > static_cast<double>(kMaximumAmountCents)) {
    return std::nullopt;
  }
  return static_cast<Cents>(std::llround(value * 100.0));
}

std::optional<Cents> ParseAmount(std::string_view text) {
  auto value = ParseDecimal(text);
  if (!value) {
    return std::nullopt;
  }
  return ToCents(*value);
}

std::optional<BasisPoints> PercentToBps(double percent) {
  if (!std::isfinite(percent) || std::fabs(percent) > 1'000'000.0) {
    return std::nullopt;
  }
  return static_cast<BasisPoints>(std::llround(percent * 100.0));
}

Cents ApplyDiscount(Cents amount, BasisPoints bps) {
  // split so that neither product can leave int64 for any non-negative amount
  const Cents keep  = kFullDiscountBps - bps;
  const Cents whole = amount / kFullDiscountBps;
  const Cents rest  = amount % kFullDiscountBps;
  return whole * keep + (rest * keep + kFullDiscountBps / 2) / kFullDiscountBps;
}

std::string FormatCents(Cents amount) {
  const bool  negative = amount < 0;
  const Cents abs      = negative ? -amount : amount;
  std::string cents    = std::to_string(abs % 100);
  if (cents.size() < 2) {
    cents.insert(0, "0");
  }
  return (negative ? "-" : "") + std::to_string(abs / 100) + "." + cents;
}

std::string FormatPercent(BasisPoints bps) {
  std::string whole = std::to_string(bps / 100);
  const int   frac  = bps % 100;
  if (frac == 0) {
    return whole;
  }
  if (frac % 10 == 0) {
    return whole + "." + std::to_string(frac / 10);
  }
  return whole + "." + (frac < 10 ? "0" : "") + std::to_string(frac);
}

} // namespace strands::util
