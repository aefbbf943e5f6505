// src/batch.cpp
#include "tp/batch.hpp"
#include "tp/log.hpp"
#include "tp/random.hpp"

#include <algorithm> // std::max
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "gmp_util.hpp"

namespace tp {
namespace {

unsigned resolve_workers(unsigned requested) {
  if (requested != 0)
    return requested;
  return std::max(1u, std::thread::hardware_concurrency());
}

// One source per worker; gmp_randclass state is not shareable.
std::vector<std::unique_ptr<RandomSource>>
make_sources(unsigned workers, const PrimalityConfig& cfg) {
  std::vector<std::unique_ptr<RandomSource>> sources;
  sources.reserve(workers);
  for (unsigned i = 0; i < workers; ++i) {
    if (cfg.seed)
      sources.push_back(std::make_unique<GmpRandomSource>(*cfg.seed + i));
    else
      sources.push_back(std::make_unique<GmpRandomSource>());
  }
  return sources;
}

} // namespace

WorkerPool::WorkerPool(unsigned workers) : workers_(resolve_workers(workers)) {}

void WorkerPool::run(std::uint64_t begin, std::uint64_t end, const Task& task) {
  stop_.store(false, std::memory_order_relaxed); // a stop only ends its own run
  if (begin >= end)
    return;

  std::atomic<std::uint64_t> cursor{begin};
  std::exception_ptr first_error;
  std::mutex error_mtx;

  auto body = [&](unsigned worker) {
    for (;;) {
      if (stop_requested())
        return;
      const std::uint64_t i = cursor.fetch_add(1, std::memory_order_relaxed);
      if (i >= end)
        return;
      try {
        task(worker, i);
      } catch (...) {
        {
          std::lock_guard<std::mutex> lock(error_mtx);
          if (!first_error)
            first_error = std::current_exception();
        }
        request_stop();
        return;
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers_);
  for (unsigned w = 0; w < workers_; ++w)
    threads.emplace_back(body, w);
  for (auto& t : threads)
    t.join();

  if (first_error)
    std::rethrow_exception(first_error);
}

std::vector<std::uint8_t> batch_verdicts(std::uint64_t lo, std::uint64_t hi,
                                         const BatchConfig& cfg,
                                         BatchProgressCb cb) {
  validate(cfg.primality);
  if (lo >= hi)
    return {};

  const std::uint64_t total = hi - lo;
  std::vector<std::uint8_t> verdicts(static_cast<std::size_t>(total), 0);

  WorkerPool pool(cfg.workers);
  auto sources = make_sources(pool.size(), cfg.primality);

  const std::uint64_t stride =
      (cfg.progress_stride != 0)
          ? cfg.progress_stride
          : std::max<std::uint64_t>(1, total / 100);
  std::atomic<std::uint64_t> done{0};

  auto log = logger();
  log->info("batch: [{}, {}) on {} workers", lo, hi, pool.size());
  auto t0 = std::chrono::steady_clock::now();

  pool.run(lo, hi, [&](unsigned worker, std::uint64_t n) {
    verdicts[n - lo] =
        is_prime(detail::from_u64(n), cfg.primality, *sources[worker]) ? 1 : 0;
    const std::uint64_t finished =
        done.fetch_add(1, std::memory_order_relaxed) + 1;
    if (cb && (finished % stride == 0 || finished == total))
      cb(finished, total);
  });

  auto t1 = std::chrono::steady_clock::now();
  const auto primes = std::count(verdicts.begin(), verdicts.end(), 1);
  log->info("batch: {} of {} prime in {} ms", primes, total,
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                .count());
  return verdicts;
}

bool batch_all_prime(std::uint64_t n, unsigned workers,
                     const PrimalityConfig& cfg) {
  validate(cfg);
  if (n <= 2)
    return true; // empty range

  WorkerPool pool(workers);
  auto sources = make_sources(pool.size(), cfg);
  std::atomic<bool> all{true};

  pool.run(2, n, [&](unsigned worker, std::uint64_t i) {
    if (!is_prime(detail::from_u64(i), cfg, *sources[worker])) {
      all.store(false, std::memory_order_relaxed);
      pool.request_stop(); // AND is already decided
    }
  });

  const bool result = all.load();
  logger()->info("batch: all of [2, {}) prime: {}", n, result);
  return result;
}

} // namespace tp
