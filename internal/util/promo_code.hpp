#pragma once

#include <random>
#include <string>
#include <string_view>

namespace strands::util {

/*
  Promotion code helpers

  Codes look like "K7M-Q2X": two groups of three characters drawn
  from an alphabet without the easily confused 0/O and 1/I.
*/

inline constexpr std::string_view kPromoCodeAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

std::string GeneratePromoCode();
std::string GeneratePromoCode(std::mt19937_64& rng);

bool IsWellFormedPromoCode(std::string_view code);

// Trims whitespace and upper-cases, as codes are typed by hand.
std::string NormalizePromoCode(std::string_view code);

} // namespace strands::util
