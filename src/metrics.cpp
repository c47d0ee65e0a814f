// ============================================================================
// metrics.cpp -- implementation of GenerationMetrics
//
// GenerationMetrics tracks the following counters for one generation run:
//
// footprints_            : Number of cell footprints synthesized.
// degenerate_footprints_ : Footprints whose max == min (normalization skipped).
// cells_                 : Number of cells whose spike train was accepted.
// spike_attempts_        : Spike-train draws, accepted and rejected.
// spikes_                : Total spikes across all accepted trains.
// frames_                : Number of movie frames composited.
// ============================================================================
#include "metrics.hpp"

namespace simcad {

GenerationMetrics::GenerationMetrics()
  : start_(clock::now()),
    footprints_(0),
    degenerate_footprints_(0),
    cells_(0),
    spike_attempts_(0),
    spikes_(0),
    frames_(0)
{}

void GenerationMetrics::mark_footprint(bool degenerate) {
  footprints_.fetch_add(1, std::memory_order_relaxed);
  if (degenerate) degenerate_footprints_.fetch_add(1, std::memory_order_relaxed);
}

void GenerationMetrics::mark_cell(std::uint64_t attempts, std::uint64_t spikes) {
  cells_.fetch_add(1, std::memory_order_relaxed);
  spike_attempts_.fetch_add(attempts, std::memory_order_relaxed);
  spikes_.fetch_add(spikes, std::memory_order_relaxed);
}

void GenerationMetrics::mark_frame_composited(std::uint64_t n) {
  frames_.fetch_add(n, std::memory_order_relaxed);
}

void GenerationMetrics::reset() {
  start_ = clock::now();
  footprints_.store(0, std::memory_order_relaxed);
  degenerate_footprints_.store(0, std::memory_order_relaxed);
  cells_.store(0, std::memory_order_relaxed);
  spike_attempts_.store(0, std::memory_order_relaxed);
  spikes_.store(0, std::memory_order_relaxed);
  frames_.store(0, std::memory_order_relaxed);
}

GenerationMetricsSnapshot GenerationMetrics::snapshot() const {
  GenerationMetricsSnapshot s{};

  const auto start = start_;
  const auto now   = clock::now();
  const auto ns0   = std::chrono::time_point_cast<std::chrono::nanoseconds>(start);
  const auto ns1   = std::chrono::time_point_cast<std::chrono::nanoseconds>(now);
  s.start_ns       = static_cast<std::uint64_t>(ns0.time_since_epoch().count());
  s.now_ns         = static_cast<std::uint64_t>(ns1.time_since_epoch().count());
  s.elapsed_sec    = std::chrono::duration<double>(now - start).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9; // avoid div-by-zero

  s.footprints            = footprints_.load(std::memory_order_relaxed);
  s.degenerate_footprints = degenerate_footprints_.load(std::memory_order_relaxed);
  s.cells                 = cells_.load(std::memory_order_relaxed);
  s.spike_attempts        = spike_attempts_.load(std::memory_order_relaxed);
  s.spikes                = spikes_.load(std::memory_order_relaxed);
  s.frames                = frames_.load(std::memory_order_relaxed);
  s.spike_retries         = s.spike_attempts > s.cells ? s.spike_attempts - s.cells : 0;

  const double dt = s.elapsed_sec;
  s.cells_per_sec   = s.cells / dt;
  s.frames_per_sec  = s.frames / dt;
  s.spikes_per_cell = s.cells ? double(s.spikes) / double(s.cells) : 0.0;

  return s;
}

void GenerationMetrics::print(std::FILE* out) const {
  GenerationMetricsSnapshot s = snapshot();

  std::fprintf(out,
    "\n=== Generation Stats ===\n"
    "FOOT:   footprints=%llu  degenerate=%llu\n"
    "SPK:    cells=%llu  attempts=%llu  retries=%llu  spikes=%llu  (%.2f/cell)\n"
    "COMP:   frames=%llu\n"
    "\n=== Throughput ===\n"
    "Elapsed: %.3f s\n"
    "Cells:   %.1f cells/s\n"
    "Frames:  %.1f fps\n",
    (unsigned long long)s.footprints,
    (unsigned long long)s.degenerate_footprints,
    (unsigned long long)s.cells,
    (unsigned long long)s.spike_attempts,
    (unsigned long long)s.spike_retries,
    (unsigned long long)s.spikes,
    s.spikes_per_cell,
    (unsigned long long)s.frames,
    s.elapsed_sec,
    s.cells_per_sec,
    s.frames_per_sec
  );
}

} // namespace simcad
