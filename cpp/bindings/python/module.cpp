#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>

#include "tp/batch.hpp"
#include "tp/random.hpp"
#include "tp/tp.hpp"

namespace py = pybind11;

// Python ints are unbounded; go through base-10 text.
static mpz_class to_mpz(const py::int_& n) {
  return tp::parse_candidate(py::str(n).cast<std::string>());
}

static py::dict is_prime_py(const py::int_& n, unsigned rounds,
                            std::optional<std::uint64_t> seed) {
  tp::PrimalityConfig cfg;
  cfg.rounds = rounds;
  cfg.seed = seed;

  const mpz_class candidate = to_mpz(n);
  tp::PrimalityResult res;
  {
    py::gil_scoped_release nogil;
    if (cfg.seed) {
      tp::GmpRandomSource rng(*cfg.seed);
      res = tp::decide(candidate, cfg, rng);
    } else {
      tp::GmpRandomSource rng;
      res = tp::decide(candidate, cfg, rng);
    }
  }

  py::dict out;
  out["n"] = n;
  out["is_prime"] = res.is_prime;
  out["tier"] = tp::to_string(res.tier);
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  return out;
}

static bool batch_all_prime_py(std::uint64_t n, unsigned workers,
                               unsigned rounds) {
  tp::PrimalityConfig cfg;
  cfg.rounds = rounds;
  py::gil_scoped_release nogil;
  return tp::batch_all_prime(n, workers, cfg);
}

PYBIND11_MODULE(tpcore, m) {
  m.doc() = "Tiered primality engine (pybind11)";

  m.def("is_prime", &is_prime_py,
      py::arg("n"),
      py::arg("rounds") = 5,
      py::arg("seed") = py::none(),
      R"pbdoc(
Decide whether n is prime, routing by magnitude to sieve, trial division,
Fermat + Miller-Rabin, or the AKS-style test.

Args:
  n (int): candidate; negative values are composite.
  rounds (int): witnesses per probabilistic test (>= 1).
  seed (int): optional seed for reproducible witnesses.

Returns:
  dict { n, is_prime, tier, ns_elapsed }.
)pbdoc");

  m.def("batch_all_prime", &batch_all_prime_py,
        py::arg("n"), py::arg("workers") = 0, py::arg("rounds") = 5,
        R"pbdoc(True iff every integer in [2, n) is prime (logical AND).)pbdoc");

  m.attr("__version__") = tp::VERSION;
}
