// include/tp/batch.hpp
#pragma once
#include "tp.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace tp {

// Fixed set of worker threads pulling indices from a shared atomic cursor.
// Threads live for the duration of one run().
class WorkerPool {
public:
  using Task = std::function<void(unsigned worker, std::uint64_t index)>;

  explicit WorkerPool(unsigned workers = 0);  // 0 = hardware_concurrency

  unsigned size() const noexcept { return workers_; }

  // Calls task(worker, i) for every i in [begin, end) unless a stop is
  // requested first; each run starts with the stop flag cleared. Blocks until
  // all workers exit, then rethrows the first exception a task raised (which
  // also stops the remaining work).
  void run(std::uint64_t begin, std::uint64_t end, const Task& task);

  void request_stop() noexcept { stop_.store(true, std::memory_order_relaxed); }
  bool stop_requested() const noexcept {
    return stop_.load(std::memory_order_relaxed);
  }

private:
  unsigned workers_;
  std::atomic<bool> stop_{false};
};

struct BatchConfig {
  PrimalityConfig primality{};
  unsigned workers = 0;               // 0 = hardware_concurrency
  std::uint32_t progress_stride = 0;  // 0 = auto (~1% of total)
};

// Progress callback: completed count and total. Called from worker threads.
using BatchProgressCb = std::function<void(std::uint64_t, std::uint64_t)>;

// One verdict (1 = prime) per integer in [lo, hi). Every slot is filled.
std::vector<std::uint8_t> batch_verdicts(std::uint64_t lo, std::uint64_t hi,
                                         const BatchConfig& cfg = {},
                                         BatchProgressCb cb = {});

// Logical AND of is_prime over [2, n). Stops early on the first composite.
// Any range holding 4 is therefore false; an empty range is true.
bool batch_all_prime(std::uint64_t n, unsigned workers = 0,
                     const PrimalityConfig& cfg = {});

} // namespace tp
