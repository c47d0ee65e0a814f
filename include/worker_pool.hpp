// ============================================================================
// worker_pool.hpp -- Index-stealing worker pool for per-cell / per-frame work
//
// `parallel_for(n, threads, fn)` runs fn(i) for every i in [0, n) on up to
// `threads` threads. Workers steal the next index from a shared atomic
// counter. Each index is visited exactly once, so a task writing only its own
// output slot needs no locking.
//
// The first exception thrown by any task stops further indices from being
// handed out and is rethrown on the calling thread once all workers joined.
// ============================================================================
#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace simcad {

/// Resolve a configured worker count: 0 => hardware_concurrency().
inline unsigned resolve_worker_threads(unsigned requested) noexcept {
  if (requested == 0) {
    requested = std::max(1u, std::thread::hardware_concurrency());
  }
  return requested;
}

/// Run `fn(i)` for i in [0, n).
/// @param n       Number of indices
/// @param threads Worker count (0 => hardware concurrency, 1 => inline)
/// @param fn      Callable taking a std::size_t index
template<typename Fn>
void parallel_for(std::size_t n, unsigned threads, Fn&& fn) {
  if (n == 0) return;
  threads = resolve_worker_threads(threads);
  if (threads > n) threads = static_cast<unsigned>(n);

  if (threads == 1) {
    for (std::size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool>        failed{false};
  std::exception_ptr       first_error;
  std::mutex               error_mtx;

  auto worker = [&] {
    for (;;) {
      if (failed.load(std::memory_order_relaxed)) break;
      const std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
      if (idx >= n) break;
      try {
        fn(idx);
      } catch (...) {
        std::lock_guard lk(error_mtx);
        if (!first_error) first_error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(threads);
  try {
    for (unsigned i = 0; i < threads; ++i) workers.emplace_back(worker);
  } catch (...) {
    // thread creation failed: stop the ones already running before unwinding
    failed.store(true, std::memory_order_relaxed);
    for (auto& t : workers) t.join();
    throw;
  }
  for (auto& t : workers) t.join();

  if (first_error) std::rethrow_exception(first_error);
}

} // namespace simcad
