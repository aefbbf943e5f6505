#include "tp/aks.hpp"
#include "tp/exact.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <vector>

TEST_CASE("SmallPrimeCursor walks the primes in order across table growth") {
  tp::SmallPrimeCursor cursor;
  const std::vector<std::uint64_t> first = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29};
  for (auto p : first)
    REQUIRE(cursor.next() == p);

  tp::SmallPrimeCursor fresh;
  std::uint64_t p = 0;
  for (int i = 0; i < 1000; ++i)
    p = fresh.next();
  REQUIRE(p == 7919); // the 1000th prime
}

TEST_CASE("Multiplicative order") {
  using tp::multiplicative_order;
  REQUIRE(multiplicative_order(2, 7, 100) == 3);
  REQUIRE(multiplicative_order(10, 7, 100) == 6); // reduced mod r first
  REQUIRE(multiplicative_order(2, 97, 1000) == 48);
  REQUIRE(multiplicative_order(1, 13, 100) == 1);
  REQUIRE(multiplicative_order(14, 7, 100) == 0); // no order when r | x
  REQUIRE(multiplicative_order(3, 7, 2) == 3);    // capped at limit + 1
}

TEST_CASE("Perfect powers are detected exactly") {
  using tp::is_perfect_power;
  for (auto n : {4u, 8u, 9u, 27u, 1331u, 3125u, 4096u, 6561u})
    REQUIRE(is_perfect_power(mpz_class(n)));
  REQUIRE(is_perfect_power(mpz_class("2305843009213693952")));   // 2^61
  REQUIRE(is_perfect_power(mpz_class("12157665459056928801")));  // 3^40
  // (10^16 + 61)^2, where a double-precision root would round
  REQUIRE(is_perfect_power(mpz_class("100000000000001220000000000003721")));

  for (auto n : {0u, 1u, 2u, 3u, 5u, 6u, 12u, 97u, 1000u})
    REQUIRE_FALSE(is_perfect_power(mpz_class(n)));
  REQUIRE_FALSE(is_perfect_power(mpz_class("2305843009213693951"))); // 2^61 - 1
  REQUIRE_FALSE(is_perfect_power(mpz_class("100000000000001220000000000003722")));
}

TEST_CASE("Order search picks the first prime r with ord_r(n) > log2(n)^2") {
  using tp::find_order_modulus;
  REQUIRE(find_order_modulus(mpz_class(97)) == 59);
  REQUIRE(find_order_modulus(mpz_class(1009)) == 107);
  REQUIRE(find_order_modulus(mpz_class(7919)) == 173);
  REQUIRE(find_order_modulus(mpz_class(1000003)) == 401);
  REQUIRE(find_order_modulus(mpz_class("10000000000000061")) == 2857);
}

TEST_CASE("AKS: 97 is prime, 100 is composite") {
  REQUIRE(tp::aks_test(mpz_class(97)));
  REQUIRE_FALSE(tp::aks_test(mpz_class(100)));
}

TEST_CASE("AKS agrees with trial division on a small range") {
  for (std::uint64_t n = 0; n <= 600; ++n)
    REQUIRE(tp::aks_test(mpz_class(static_cast<unsigned long>(n))) ==
            tp::trial_division_is_prime(n));
}

TEST_CASE("AKS on selected candidates") {
  using tp::aks_test;
  REQUIRE(aks_test(mpz_class(1009)));
  REQUIRE(aks_test(mpz_class(7919)));
  REQUIRE(aks_test(mpz_class(1000003)));    // reaches the congruence stage
  REQUIRE_FALSE(aks_test(mpz_class(1331)));  // 11^3
  REQUIRE_FALSE(aks_test(mpz_class(561)));   // Carmichael
  REQUIRE_FALSE(aks_test(mpz_class(10403))); // 101 * 103, caught by gcd
  REQUIRE_FALSE(aks_test(mpz_class(-97)));
}
