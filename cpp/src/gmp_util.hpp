// src/gmp_util.hpp (internal)
#pragma once
#include <cmath>
#include <cstdint>
#include <gmp.h>
#include <gmpxx.h>

namespace tp {
namespace detail {

// unsigned long is only 32 bits on some ABIs; go through mpz_import/export.
inline mpz_class from_u64(std::uint64_t v) {
  mpz_class z;
  mpz_import(z.get_mpz_t(), 1, -1, sizeof v, 0, 0, &v);
  return z;
}

inline bool fits_u64(const mpz_class& z) {
  return mpz_sgn(z.get_mpz_t()) >= 0 && mpz_sizeinbase(z.get_mpz_t(), 2) <= 64;
}

// Precondition: fits_u64(z).
inline std::uint64_t to_u64(const mpz_class& z) {
  std::uint64_t v = 0;
  mpz_export(&v, nullptr, -1, sizeof v, 0, 0, z.get_mpz_t());
  return v;
}

inline std::size_t bit_length(const mpz_class& z) {
  return mpz_sizeinbase(z.get_mpz_t(), 2);
}

// log2(z) for z > 0, accurate to double precision at any magnitude.
inline double log2(const mpz_class& z) {
  long exp = 0;
  const double mant = mpz_get_d_2exp(&exp, z.get_mpz_t()); // in [0.5, 1)
  return std::log2(mant) + static_cast<double>(exp);
}

} // namespace detail
} // namespace tp
