// src/aks.cpp
#include "tp/aks.hpp"
#include "tp/exact.hpp"
#include "tp/log.hpp"

#include <cmath>
#include <cstdint>
#include <gmp.h>

#include "gmp_util.hpp"

namespace tp {
// Forward decl for the polynomial stage (no public header exposure)
bool aks_congruences_hold(const mpz_class& n, std::uint64_t r,
                          std::uint64_t a_max);
} // namespace tp

namespace tp {

bool is_perfect_power(const mpz_class& n) {
  if (n < 4)
    return false;
  // b > log2(n) would need a base in (1, 2), so bit_length bounds the scan.
  const std::size_t max_b = detail::bit_length(n);
  mpz_class root;
  for (std::size_t b = 2; b <= max_b; ++b) {
    if (mpz_root(root.get_mpz_t(), n.get_mpz_t(),
                 static_cast<unsigned long>(b)) != 0)
      return true;
  }
  return false;
}

std::uint64_t find_order_modulus(const mpz_class& n) {
  const double lg = detail::log2(n);
  const std::uint64_t limit = static_cast<std::uint64_t>(std::floor(lg * lg));

  SmallPrimeCursor primes;
  primes.next(); // skip 2
  for (;;) {
    const std::uint64_t r = primes.next();
    const std::uint64_t residue = mpz_fdiv_ui(n.get_mpz_t(), r);
    // r | n has no order; the gcd screen below r catches any smaller factor
    if (multiplicative_order(residue, r, limit) > limit)
      return r;
  }
}

bool aks_test(const mpz_class& n) {
  if (const auto decided = small_case(n))
    return *decided;

  if (is_perfect_power(n))
    return false;

  const std::uint64_t r = find_order_modulus(n);

  const mpz_class r_z = detail::from_u64(r);
  const std::uint64_t gcd_end = n < r_z ? detail::to_u64(n) : r;
  for (std::uint64_t a = 2; a < gcd_end; ++a) {
    if (mpz_gcd_ui(nullptr, n.get_mpz_t(), a) > 1)
      return false;
  }

  if (n <= r_z)
    return true;

  const double lg = detail::log2(n);
  const std::uint64_t a_max = static_cast<std::uint64_t>(
      std::floor(std::sqrt(static_cast<double>(r)) * lg));
  auto log = logger();
  log->debug("aks: n has {} bits, r={}, checking {} congruences",
             detail::bit_length(n), r, a_max);
  return aks_congruences_hold(n, r, a_max);
}

} // namespace tp
