// src/small_primes.cpp
#include "tp/aks.hpp"

#include <cstdint>
#include <numeric> // std::gcd

namespace tp {
namespace {

constexpr std::size_t kInitialTable = 256;

inline std::uint64_t mod_mul(std::uint64_t a, std::uint64_t b,
                             std::uint64_t m) {
  return static_cast<std::uint64_t>((__uint128_t)a * b %
                                    m); // safe for 64-bit intermediates
}

} // namespace

SmallPrimeCursor::SmallPrimeCursor() : composite_(kInitialTable, false) {
  composite_[0] = composite_[1] = true;
  for (std::size_t x = 2; x * x < composite_.size(); ++x)
    if (!composite_[x])
      for (std::size_t i = x * x; i < composite_.size(); i += x)
        composite_[i] = true;
}

void SmallPrimeCursor::grow() {
  const std::size_t old = composite_.size();
  const std::size_t size = old * 2;
  composite_.resize(size, false);
  // Only the new half needs crossing off; primes up to sqrt(size) are all
  // already decided because sqrt(2*old) < old for old >= 4.
  for (std::size_t x = 2; x * x < size; ++x) {
    if (composite_[x])
      continue;
    std::size_t start = (old + x - 1) / x * x;
    if (start < x * x)
      start = x * x;
    for (std::size_t i = start; i < size; i += x)
      composite_[i] = true;
  }
}

std::uint64_t SmallPrimeCursor::next() {
  for (;;) {
    ++pos_;
    if (pos_ >= composite_.size())
      grow();
    if (!composite_[pos_])
      return pos_;
  }
}

std::uint64_t multiplicative_order(std::uint64_t x, std::uint64_t r,
                                   std::uint64_t limit) {
  const std::uint64_t one = 1 % r;
  x %= r;
  if (std::gcd(x, r) != 1)
    return 0;

  std::uint64_t v = x;
  std::uint64_t k = 1;
  while (v != one) {
    if (k > limit)
      return limit + 1;
    v = mod_mul(v, x, r);
    ++k;
  }
  return k;
}

} // namespace tp
