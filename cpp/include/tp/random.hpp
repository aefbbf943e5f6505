// include/tp/random.hpp
#pragma once
#include <cstdint>
#include <gmpxx.h>

namespace tp {

// Source of witnesses for the probabilistic tests. Not required to be
// thread-safe; give each thread its own instance.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform integer in [lo, hi]. Precondition: lo <= hi.
  virtual mpz_class uniform(const mpz_class& lo, const mpz_class& hi) = 0;
};

// Mersenne Twister state from GMP.
class GmpRandomSource final : public RandomSource {
public:
  GmpRandomSource();  // seeded from std::random_device
  explicit GmpRandomSource(std::uint64_t seed);

  mpz_class uniform(const mpz_class& lo, const mpz_class& hi) override;

private:
  gmp_randclass state_;
};

} // namespace tp
