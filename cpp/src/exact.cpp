// src/exact.cpp
#include "tp/exact.hpp"

#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace tp {

std::optional<bool> small_case(const mpz_class& n) noexcept {
  if (mpz_cmp_ui(n.get_mpz_t(), 2) < 0)
    return false;
  if (mpz_cmp_ui(n.get_mpz_t(), 4) < 0)
    return true; // 2 or 3
  if (mpz_even_p(n.get_mpz_t()) || mpz_divisible_ui_p(n.get_mpz_t(), 3))
    return false;
  return std::nullopt;
}

bool sieve_is_prime(std::uint64_t n) {
  if (n > kSieveTableLimit)
    throw std::length_error("sieve table for n=" + std::to_string(n) +
                            " exceeds " + std::to_string(kSieveTableLimit) +
                            " entries");

  std::vector<bool> table(static_cast<std::size_t>(n) + 1, true);
  table[0] = false;
  if (n >= 1)
    table[1] = false;

  for (std::uint64_t x = 2; x * x <= n; ++x) {
    if (!table[x])
      continue;
    for (std::uint64_t i = x * x; i <= n; i += x)
      table[i] = false;
  }
  return table[n];
}

bool trial_division_is_prime(std::uint64_t n) noexcept {
  if (n < 2)
    return false;
  // i <= n / i is i*i <= n without the overflow near 2^64
  for (std::uint64_t i = 2; i <= n / i; ++i) {
    if (n % i == 0)
      return false;
  }
  return true;
}

} // namespace tp
