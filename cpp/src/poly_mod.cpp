// src/poly_mod.cpp
#include <algorithm>
#include <cstdint>
#include <gmp.h>
#include <gmpxx.h>
#include <vector>

#include "gmp_util.hpp"

namespace tp {
namespace {

// Coefficients of X^0 .. X^(r-1), each reduced into [0, n).
using Poly = std::vector<mpz_class>;

// Arithmetic in Z_n[X] / (X^r - 1). Products go through one big-integer
// multiply: each coefficient gets a fixed slot of limbs wide enough to hold
// a full convolution sum (< r * n^2) without carrying into its neighbour.
class PolyRing {
public:
  PolyRing(const mpz_class& n, std::size_t r) : n_(n), r_(r) {
    const std::size_t bits =
        2 * detail::bit_length(n) + detail::bit_length(detail::from_u64(r)) + 1;
    slot_ = (bits + GMP_NUMB_BITS - 1) / GMP_NUMB_BITS;
  }

  void sqr(Poly& p) {
    pack(p);
    mpz_mul(packed_.get_mpz_t(), packed_.get_mpz_t(), packed_.get_mpz_t());
    unpack_fold(p);
  }

  // p *= (X + c), with 0 <= c < n
  void mul_linear(Poly& p, const mpz_class& c) {
    const mpz_class wrap = p[r_ - 1]; // X^(r-1) * X == X^0
    for (std::size_t i = r_ - 1; i > 0; --i) {
      tmp_ = p[i - 1];
      mpz_addmul(tmp_.get_mpz_t(), c.get_mpz_t(), p[i].get_mpz_t());
      mpz_mod(p[i].get_mpz_t(), tmp_.get_mpz_t(), n_.get_mpz_t());
    }
    tmp_ = wrap;
    mpz_addmul(tmp_.get_mpz_t(), c.get_mpz_t(), p[0].get_mpz_t());
    mpz_mod(p[0].get_mpz_t(), tmp_.get_mpz_t(), n_.get_mpz_t());
  }

private:
  void pack(const Poly& p) {
    const std::size_t total = r_ * slot_;
    mpz_ptr z = packed_.get_mpz_t();
    mp_limb_t* w = mpz_limbs_write(z, static_cast<mp_size_t>(total));
    std::fill(w, w + total, mp_limb_t{0});
    for (std::size_t i = 0; i < r_; ++i) {
      mpz_srcptr c = p[i].get_mpz_t();
      const mp_limb_t* src = mpz_limbs_read(c);
      std::copy(src, src + mpz_size(c), w + i * slot_);
    }
    mpz_limbs_finish(z, static_cast<mp_size_t>(total)); // normalizes
  }

  // Splits the product back into slots, folding X^k onto X^(k mod r).
  void unpack_fold(Poly& p) {
    for (auto& c : p)
      c = 0;
    mpz_srcptr z = packed_.get_mpz_t();
    const std::size_t have = mpz_size(z);
    const mp_limb_t* src = mpz_limbs_read(z);
    std::size_t k = 0;
    for (std::size_t off = 0; off < have; off += slot_, ++k) {
      const std::size_t len = std::min(slot_, have - off);
      mpz_t view;
      mpz_add(p[k % r_].get_mpz_t(), p[k % r_].get_mpz_t(),
              mpz_roinit_n(view, src + off, static_cast<mp_size_t>(len)));
    }
    for (auto& c : p)
      mpz_mod(c.get_mpz_t(), c.get_mpz_t(), n_.get_mpz_t());
  }

  const mpz_class& n_;
  std::size_t r_;
  std::size_t slot_ = 1;
  mpz_class packed_;
  mpz_class tmp_;
};

} // namespace

// (X + a)^n == X^(n mod r) + a  (mod X^r - 1, n)  for every a in [1, a_max].
// Precondition: n > r >= 2, a_max < n.
bool aks_congruences_hold(const mpz_class& n, std::uint64_t r,
                          std::uint64_t a_max) {
  const std::size_t rr = static_cast<std::size_t>(r);
  PolyRing ring(n, rr);
  const std::size_t top = detail::bit_length(n);
  const std::size_t shift =
      static_cast<std::size_t>(mpz_fdiv_ui(n.get_mpz_t(), r));

  Poly p(rr);
  Poly want(rr);
  for (std::uint64_t a = 1; a <= a_max; ++a) {
    const mpz_class c = detail::from_u64(a);

    // left-to-right square and multiply over the bits of n
    std::fill(p.begin(), p.end(), mpz_class(0));
    p[0] = 1;
    for (std::size_t bit = top; bit-- > 0;) {
      ring.sqr(p);
      if (mpz_tstbit(n.get_mpz_t(), bit))
        ring.mul_linear(p, c);
    }

    std::fill(want.begin(), want.end(), mpz_class(0));
    want[shift] = 1;
    want[0] += c;
    mpz_mod(want[0].get_mpz_t(), want[0].get_mpz_t(), n.get_mpz_t());
    if (p != want)
      return false;
  }
  return true;
}

} // namespace tp
