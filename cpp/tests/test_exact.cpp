#include "tp/exact.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>

TEST_CASE("SmallCase: n < 2 is composite, 2 and 3 are prime") {
  using tp::small_case;
  for (long n : {-1000000L, -7L, -2L, -1L, 0L, 1L}) {
    auto v = small_case(mpz_class(n));
    REQUIRE(v.has_value());
    REQUIRE_FALSE(*v);
  }
  REQUIRE(small_case(mpz_class(2)) == true);
  REQUIRE(small_case(mpz_class(3)) == true);
}

TEST_CASE("SmallCase: mod 2 / mod 3 screen agrees with divisibility") {
  using tp::small_case;
  for (unsigned long n = 4; n < 5000; ++n) {
    auto v = small_case(mpz_class(n));
    if (n % 2 == 0 || n % 3 == 0) {
      REQUIRE(v.has_value());
      REQUIRE_FALSE(*v);
    } else {
      REQUIRE_FALSE(v.has_value()); // undecided, caller continues
    }
  }
  // 25 and 35 slip through; the screen only knows about 2 and 3
  REQUIRE_FALSE(small_case(mpz_class(25)).has_value());
  REQUIRE_FALSE(small_case(mpz_class("1000000000000000000000000003")).has_value());
}

TEST_CASE("Sieve: truth table on small n") {
  using tp::sieve_is_prime;
  for (std::uint64_t p : {2u, 3u, 5u, 7u, 11u, 13u, 17u, 97u, 7919u, 9973u})
    REQUIRE(sieve_is_prime(p));
  for (std::uint64_t c : {0u, 1u, 4u, 9u, 25u, 49u, 91u, 561u, 9999u})
    REQUIRE_FALSE(sieve_is_prime(c));
}

TEST_CASE("Sieve refuses tables above the cap") {
  REQUIRE_THROWS_AS(tp::sieve_is_prime(tp::kSieveTableLimit + 1),
                    std::length_error);
}

TEST_CASE("Trial division: truth table across the medium range") {
  using tp::trial_division_is_prime;
  REQUIRE_FALSE(trial_division_is_prime(0));
  REQUIRE_FALSE(trial_division_is_prime(1));
  REQUIRE(trial_division_is_prime(2));
  REQUIRE(trial_division_is_prime(10007));
  REQUIRE(trial_division_is_prime(9999991));
  REQUIRE(trial_division_is_prime(99999989));  // largest prime below 10^8
  REQUIRE(trial_division_is_prime(100000007));
  REQUIRE_FALSE(trial_division_is_prime(10001));       // 73 * 137
  REQUIRE_FALSE(trial_division_is_prime(99999999));
  REQUIRE_FALSE(trial_division_is_prime(9999800001ull)); // 99999^2
}

TEST_CASE("Sieve and trial division agree, including the 10,000 boundary") {
  using tp::sieve_is_prime; using tp::trial_division_is_prime;
  for (std::uint64_t n = 0; n <= 3000; ++n)
    REQUIRE(sieve_is_prime(n) == trial_division_is_prime(n));
  for (std::uint64_t n = 9990; n <= 10010; ++n)
    REQUIRE(sieve_is_prime(n) == trial_division_is_prime(n));
}
