// include/tp/probabilistic.hpp
#pragma once
#include <gmpxx.h>

namespace tp {

class RandomSource;

// Both tests draw k witnesses uniformly from [2, n-2]. A failed round is a
// proof of compositeness; passing every round means "probably prime".
// For n < 5 the witness interval is degenerate and small_case() decides.

// Fermat: a^(n-1) == 1 (mod n). Fooled by Carmichael numbers whenever the
// witness is coprime to n.
bool fermat_test(const mpz_class& n, unsigned k, RandomSource& rng);

// Miller-Rabin with n-1 = d * 2^r, d odd. A composite survives one round
// with probability at most 1/4.
bool miller_rabin_test(const mpz_class& n, unsigned k, RandomSource& rng);

} // namespace tp
