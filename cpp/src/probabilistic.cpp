// src/probabilistic.cpp
#include "tp/probabilistic.hpp"
#include "tp/exact.hpp"
#include "tp/random.hpp"

#include <gmp.h>

namespace tp {
namespace {

// Witness interval [2, n-2] is empty for n < 4 and a single point for n == 4.
inline bool degenerate(const mpz_class& n) {
  return mpz_cmp_ui(n.get_mpz_t(), 5) < 0;
}

} // namespace

bool fermat_test(const mpz_class& n, unsigned k, RandomSource& rng) {
  if (degenerate(n))
    return small_case(n).value_or(false);

  const mpz_class lo = 2;
  const mpz_class hi = n - 2;
  const mpz_class e = n - 1;
  mpz_class x;
  for (unsigned round = 0; round < k; ++round) {
    const mpz_class a = rng.uniform(lo, hi);
    mpz_powm(x.get_mpz_t(), a.get_mpz_t(), e.get_mpz_t(), n.get_mpz_t());
    if (x != 1)
      return false;
  }
  return true;
}

bool miller_rabin_test(const mpz_class& n, unsigned k, RandomSource& rng) {
  if (degenerate(n))
    return small_case(n).value_or(false);

  const mpz_class n_minus_1 = n - 1;

  // n-1 = d * 2^r with d odd (r == 0 for even n, which then fails below)
  mpz_class d;
  const mp_bitcnt_t r = mpz_scan1(n_minus_1.get_mpz_t(), 0);
  mpz_tdiv_q_2exp(d.get_mpz_t(), n_minus_1.get_mpz_t(), r);

  const mpz_class lo = 2;
  const mpz_class hi = n - 2;
  mpz_class x;
  for (unsigned round = 0; round < k; ++round) {
    const mpz_class a = rng.uniform(lo, hi);
    mpz_powm(x.get_mpz_t(), a.get_mpz_t(), d.get_mpz_t(), n.get_mpz_t());
    if (x == 1 || x == n_minus_1)
      continue;

    bool witnessed = true;
    for (mp_bitcnt_t i = 1; i < r; ++i) {
      mpz_powm_ui(x.get_mpz_t(), x.get_mpz_t(), 2, n.get_mpz_t());
      if (x == n_minus_1) {
        witnessed = false;
        break;
      }
    }
    if (witnessed)
      return false; // a proves n composite
  }
  return true;
}

} // namespace tp
