// src/random.cpp
#include "tp/random.hpp"

#include <random>
#include <stdexcept>

#include "gmp_util.hpp"

namespace tp {

GmpRandomSource::GmpRandomSource() : state_(gmp_randinit_mt) {
  std::random_device rd;
  const std::uint64_t seed =
      (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
  state_.seed(detail::from_u64(seed));
}

GmpRandomSource::GmpRandomSource(std::uint64_t seed)
    : state_(gmp_randinit_mt) {
  state_.seed(detail::from_u64(seed));
}

mpz_class GmpRandomSource::uniform(const mpz_class& lo, const mpz_class& hi) {
  if (hi < lo)
    throw std::invalid_argument("uniform: empty range");
  // get_z_range(m) is uniform over [0, m-1]
  const mpz_class span = hi - lo + 1;
  mpz_class offset = state_.get_z_range(span);
  return lo + offset;
}

} // namespace tp
