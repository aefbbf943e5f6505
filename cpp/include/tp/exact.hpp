// include/tp/exact.hpp
#pragma once
#include <cstdint>
#include <gmpxx.h>
#include <optional>

namespace tp {

// Upper bound on the sieve table (entries). Above this the sieve refuses to
// allocate; the dispatcher keeps sieve_limit far below it.
inline constexpr std::uint64_t kSieveTableLimit = std::uint64_t{1} << 30;

// Cheap screen run before every tier.
// false: n < 2, or n >= 4 divisible by 2 or 3.  true: n is 2 or 3.
// nullopt: undecided, the caller must continue.
std::optional<bool> small_case(const mpz_class& n) noexcept;

// Sieve of Eratosthenes over [0, n]; returns table[n]. Exact for every n.
// Throws std::length_error if n > kSieveTableLimit.
bool sieve_is_prime(std::uint64_t n);

// Divisors 2..floor(sqrt(n)). Exact, O(sqrt(n)) time.
bool trial_division_is_prime(std::uint64_t n) noexcept;

} // namespace tp
