// src/tp_core.cpp
#include "tp/aks.hpp"
#include "tp/exact.hpp"
#include "tp/log.hpp"
#include "tp/probabilistic.hpp"
#include "tp/random.hpp"
#include "tp/tp.hpp"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>

#include "gmp_util.hpp"

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}
} // namespace

namespace tp {

const char* to_string(Tier t) noexcept {
  switch (t) {
  case Tier::SmallCase:
    return "small-case";
  case Tier::Sieve:
    return "sieve";
  case Tier::TrialDivision:
    return "trial-division";
  case Tier::Probabilistic:
    return "probabilistic";
  case Tier::Deterministic:
    return "deterministic";
  }
  return "?";
}

Tier select_tier(const mpz_class& n, const TierBounds& b) noexcept {
  // Negative n never reaches a tier in decide(); mapping it to the lowest
  // bucket keeps this total.
  if (!detail::fits_u64(n))
    return mpz_sgn(n.get_mpz_t()) < 0 ? Tier::Sieve : Tier::Deterministic;
  const std::uint64_t v = detail::to_u64(n);
  if (v < b.sieve_limit)
    return Tier::Sieve;
  if (v < b.trial_limit)
    return Tier::TrialDivision;
  if (v < b.probabilistic_limit)
    return Tier::Probabilistic;
  return Tier::Deterministic;
}

void validate(const PrimalityConfig& cfg) {
  if (cfg.rounds == 0)
    throw std::invalid_argument("rounds must be >= 1");
  const TierBounds& b = cfg.bounds;
  if (b.sieve_limit > b.trial_limit || b.trial_limit > b.probabilistic_limit)
    throw std::invalid_argument(
        "tier bounds must satisfy sieve <= trial <= probabilistic");
  if (b.sieve_limit > kSieveTableLimit)
    throw std::invalid_argument("sieve_limit exceeds the sieve table cap");
}

mpz_class parse_candidate(const std::string& text) {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-'))
    ++i;
  if (i == text.size())
    throw std::invalid_argument("not a whole number: '" + text + "'");
  for (std::size_t j = i; j < text.size(); ++j) {
    if (!std::isdigit(static_cast<unsigned char>(text[j])))
      throw std::invalid_argument("not a whole number: '" + text + "'");
  }
  // mpz_set_str rejects a leading '+'
  mpz_class n;
  const std::string digits = text[0] == '+' ? text.substr(1) : text;
  if (mpz_set_str(n.get_mpz_t(), digits.c_str(), 10) != 0)
    throw std::invalid_argument("not a whole number: '" + text + "'");
  return n;
}

std::uint64_t parse_count(const std::string& text, std::uint64_t max) {
  if (text.empty() || text[0] == '-' || text[0] == '+')
    throw std::invalid_argument("not a count: '" + text + "'");
  const mpz_class v = parse_candidate(text);
  if (!detail::fits_u64(v) || detail::to_u64(v) > max)
    throw std::invalid_argument("count out of range: '" + text + "'");
  return detail::to_u64(v);
}

PrimalityResult decide(const mpz_class& n, const PrimalityConfig& cfg,
                       RandomSource& rng) {
  validate(cfg);

  PrimalityResult out;
  out.n = n;
  auto t0 = std::chrono::steady_clock::now();

  if (const auto decided = small_case(n)) {
    out.is_prime = *decided;
    out.tier = Tier::SmallCase;
  } else {
    out.tier = select_tier(n, cfg.bounds);
    switch (out.tier) {
    case Tier::Sieve:
      out.is_prime = sieve_is_prime(detail::to_u64(n));
      break;
    case Tier::TrialDivision:
      out.is_prime = trial_division_is_prime(detail::to_u64(n));
      break;
    case Tier::Probabilistic:
      // Fermat is the cheap screen; Miller-Rabin still has to agree.
      out.is_prime = fermat_test(n, cfg.rounds, rng) &&
                     miller_rabin_test(n, cfg.rounds, rng);
      break;
    case Tier::Deterministic:
      if (cfg.prefilter_huge && !(fermat_test(n, cfg.rounds, rng) &&
                                  miller_rabin_test(n, cfg.rounds, rng))) {
        out.is_prime = false;
        break;
      }
      out.is_prime = aks_test(n);
      break;
    case Tier::SmallCase:
      break; // not produced by select_tier
    }
  }

  auto t1 = std::chrono::steady_clock::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());

  auto log = logger();
  if (log->should_log(spdlog::level::debug))
    log->debug("n={} tier={} verdict={} ns={}", n.get_str(),
               to_string(out.tier), out.is_prime ? "prime" : "composite",
               out.ns_elapsed);
  return out;
}

bool is_prime(const mpz_class& n, const PrimalityConfig& cfg,
              RandomSource& rng) {
  return decide(n, cfg, rng).is_prime;
}

bool is_prime(const mpz_class& n, const PrimalityConfig& cfg) {
  if (cfg.seed) {
    GmpRandomSource rng(*cfg.seed);
    return is_prime(n, cfg, rng);
  }
  GmpRandomSource rng;
  return is_prime(n, cfg, rng);
}

std::string engine_info() {
  return std::string("tp:") + VERSION + "; gmp:" +
         (::gmp_version ? ::gmp_version : "?") + "; " + compiler_info();
}

} // namespace tp
