#include "tp/batch.hpp"
#include "tp/log.hpp"
#include "tp/random.hpp"
#include "tp/tp.hpp"
#include <chrono>
#include <climits>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  // Flags: --rounds=K, --seed=S, --batch=N, --workers=W, --bench=R,
  //        --verbose, --version
  tp::PrimalityConfig cfg;
  unsigned repeats = 1, workers = 0;
  std::vector<std::uint64_t> batches;
  std::vector<mpz_class> candidates;
  auto log = tp::logger();

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--rounds=", 0) == 0) {
        cfg.rounds =
            static_cast<unsigned>(tp::parse_count(a.substr(9), UINT_MAX));
      } else if (a.rfind("--seed=", 0) == 0) {
        cfg.seed = tp::parse_count(a.substr(7));
      } else if (a.rfind("--batch=", 0) == 0) {
        batches.push_back(tp::parse_count(a.substr(8)));
      } else if (a.rfind("--workers=", 0) == 0) {
        workers =
            static_cast<unsigned>(tp::parse_count(a.substr(10), UINT_MAX));
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats =
            static_cast<unsigned>(tp::parse_count(a.substr(8), UINT_MAX));
      } else if (a == "--verbose") {
        log->set_level(spdlog::level::debug);
      } else if (a == "--version") {
        std::cout << tp::engine_info() << "\n";
        return 0;
      } else {
        candidates.push_back(tp::parse_candidate(a));
      }
    } catch (const std::exception& e) {
      log->warn("skip '{}': {}", a, e.what());
    }
  }
  if (candidates.empty() && batches.empty()) {
    candidates = {17, 21};
    batches = {17, 21};
  }
  if (repeats == 0)
    repeats = 1;

  try {
    tp::validate(cfg);
  } catch (const std::invalid_argument& e) {
    log->error("{}", e.what());
    return 2;
  }

  std::unique_ptr<tp::RandomSource> rng;
  if (cfg.seed)
    rng = std::make_unique<tp::GmpRandomSource>(*cfg.seed);
  else
    rng = std::make_unique<tp::GmpRandomSource>();

  for (const auto& n : candidates) {
    std::uint64_t best = UINT64_MAX, sum = 0;
    tp::PrimalityResult res;
    for (unsigned r = 0; r < repeats; ++r) {
      res = tp::decide(n, cfg, *rng);
      sum += res.ns_elapsed;
      if (res.ns_elapsed < best)
        best = res.ns_elapsed;
    }
    if (repeats == 1) {
      std::cout << n << " → " << (res.is_prime ? "PRIME" : "COMPOSITE")
                << " | tier=" << tp::to_string(res.tier)
                << " | core(ns)=" << res.ns_elapsed << "\n";
    } else {
      std::cout << n << " bench repeats=" << repeats
                << " | tier=" << tp::to_string(res.tier)
                << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats)
                << "\n";
    }
  }

  for (auto n : batches) {
    auto t0 = std::chrono::steady_clock::now();
    const bool all = tp::batch_all_prime(n, workers, cfg);
    auto t1 = std::chrono::steady_clock::now();
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    std::cout << "all prime in [2, " << n << ") → " << (all ? "true" : "false")
              << " | ms=" << ms << "\n";
  }
  return 0;
}
