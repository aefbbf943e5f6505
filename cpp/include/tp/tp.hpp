// include/tp/tp.hpp
#pragma once
#include <cstdint>
#include <gmpxx.h>
#include <optional>
#include <string>

namespace tp {

class RandomSource;

// Bump when the public contract changes (handy for logging/UI).
inline constexpr const char* VERSION = "0.1.0";

// Magnitude boundaries between tiers. A candidate n lands in the first tier
// whose limit it is below; everything from probabilistic_limit up is huge.
struct TierBounds {
  std::uint64_t sieve_limit = 10'000;
  std::uint64_t trial_limit = 100'000'000;
  std::uint64_t probabilistic_limit = 10'000'000'000'000'000ull;
};

struct PrimalityConfig {
  unsigned rounds = 5;         // witnesses per probabilistic test
  TierBounds bounds{};
  bool prefilter_huge = true;  // run Fermat + Miller-Rabin before the AKS tier
  std::optional<std::uint64_t> seed;  // only used when we own the RandomSource
};

enum class Tier {
  SmallCase,      // settled by the n < 4 / mod 2 / mod 3 screen
  Sieve,
  TrialDivision,
  Probabilistic,
  Deterministic,
};

struct PrimalityResult {
  mpz_class n;
  bool is_prime = false;
  Tier tier = Tier::SmallCase;
  std::uint64_t ns_elapsed = 0;  // wall-clock nanoseconds (best effort)
};

const char* to_string(Tier t) noexcept;

// Total mapping from magnitude to tier. Does not look at divisibility, so
// e.g. 21 maps to Sieve even though the dispatcher never gets that far.
Tier select_tier(const mpz_class& n, const TierBounds& b) noexcept;

// Throws std::invalid_argument on rounds == 0, unordered bounds, or a sieve
// limit larger than the sieve table cap.
void validate(const PrimalityConfig& cfg);

// Parses a base-10 whole number with optional sign. Throws
// std::invalid_argument for anything else ("", "1.5", "0x11", "12abc").
mpz_class parse_candidate(const std::string& text);

// Non-negative count for option values (rounds, workers, seeds). Throws
// std::invalid_argument on a sign, non-digits, or a value above `max`.
std::uint64_t parse_count(const std::string& text,
                          std::uint64_t max = UINT64_MAX);

// Full decision: SmallCase, then exactly one tier. Negative n is Composite.
PrimalityResult decide(const mpz_class& n, const PrimalityConfig& cfg,
                       RandomSource& rng);

bool is_prime(const mpz_class& n, const PrimalityConfig& cfg,
              RandomSource& rng);

// Convenience overload; draws witnesses from a GmpRandomSource seeded from
// cfg.seed, or from std::random_device when unset.
bool is_prime(const mpz_class& n, const PrimalityConfig& cfg = {});

// e.g. "tp:0.1.0; gmp:6.3.0; gcc:13.2.0"
std::string engine_info();

} // namespace tp
