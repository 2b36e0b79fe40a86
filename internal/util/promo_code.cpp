#include "promo_code.hpp"

#include <cctype>

namespace strands::util {

std::string GeneratePromoCode() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return GeneratePromoCode(rng);
}

std::string GeneratePromoCode(std::mt19937_64& rng) {
  std::uniform_int_distribution<std::size_t> pick(0, kPromoCodeAlphabet.size() - 1);

  std::string code;
  code.reserve(7);
  for (int i = 0; i < 6; ++i) {
    if (i == 3) code.push_back('-');
    code.push_back(kPromoCodeAlphabet[pick(rng)]);
  }
  return code;
}

bool IsWellFormedPromoCode(std::string_view code) {
  if (code.size() != 7 || code[3] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < code.size(); ++i) {
    if (i == 3) continue;
    if (kPromoCodeAlphabet.find(code[i]) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

std::string NormalizePromoCode(std::string_view code) {
  std::size_t begin = 0;
  std::size_t end   = code.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(code[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(code[end - 1]))) --end;

  std::string out;
  out.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(code[i]))));
  }
  return out;
}

} // namespace strands::util
