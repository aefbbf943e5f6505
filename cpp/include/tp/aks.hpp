// include/tp/aks.hpp
#pragma once
#include <cstdint>
#include <gmpxx.h>
#include <vector>

namespace tp {

// Yields 2, 3, 5, 7, ... in order. Backed by a sieve table that doubles in
// size whenever the cursor runs off its end.
class SmallPrimeCursor {
public:
  SmallPrimeCursor();

  std::uint64_t next();

private:
  void grow();

  std::vector<bool> composite_;
  std::uint64_t pos_ = 1;
};

// Smallest k >= 1 with x^k == 1 (mod r), or 0 when gcd(x, r) != 1.
// Stops counting once k exceeds `limit` and returns limit + 1.
std::uint64_t multiplicative_order(std::uint64_t x, std::uint64_t r,
                                   std::uint64_t limit);

// True iff n == m^b for integers m >= 2, b >= 2. Exact integer roots.
bool is_perfect_power(const mpz_class& n);

// First prime r >= 3 with ord_r(n) > (log2 n)^2. Precondition: n >= 2.
std::uint64_t find_order_modulus(const mpz_class& n);

// AKS-style deterministic test:
//   small_case, perfect power, order search for r, gcd(a, n) for a < r,
//   n <= r accepts, then (X + a)^n == X^(n mod r) + a (mod X^r - 1, n)
//   for a in [1, floor(sqrt(r) * log2 n)].
bool aks_test(const mpz_class& n);

} // namespace tp
