// ============================================================================
// metrics.hpp -- counters for one movie generation run
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace simcad {

// ============================================================================
// `GenerationMetricsSnapshot` struct
// Snapshot of metrics at a point in time, with derived rates.
// ============================================================================
struct GenerationMetricsSnapshot {
  // timestamps (nanoseconds since steady_clock::epoch)
  std::uint64_t start_ns{0};
  std::uint64_t now_ns{0};
  double        elapsed_sec{0.0};

  // raw counters
  std::uint64_t footprints{0};
  std::uint64_t degenerate_footprints{0};

  std::uint64_t cells{0};
  std::uint64_t spike_attempts{0};
  std::uint64_t spike_retries{0};
  std::uint64_t spikes{0};

  std::uint64_t frames{0};

  // derived
  double cells_per_sec{0.0};
  double frames_per_sec{0.0};
  double spikes_per_cell{0.0};
};

// ============================================================================
// `GenerationMetrics` class
// Thread-safe: all increments are atomic and relaxed.
// ============================================================================
class GenerationMetrics {
public:
  GenerationMetrics();

  void mark_footprint(bool degenerate);
  void mark_cell(std::uint64_t attempts, std::uint64_t spikes);
  void mark_frame_composited(std::uint64_t n = 1);

  // Reset all counters and the start time (careful if other threads write)
  void reset();

  GenerationMetricsSnapshot snapshot() const;

  // Pretty-print snapshot to a FILE* (stdout by default).
  void print(std::FILE* out = stdout) const;

private:
  using clock = std::chrono::steady_clock;

  clock::time_point start_;

  std::atomic<std::uint64_t> footprints_;
  std::atomic<std::uint64_t> degenerate_footprints_;

  std::atomic<std::uint64_t> cells_;
  std::atomic<std::uint64_t> spike_attempts_;
  std::atomic<std::uint64_t> spikes_;

  std::atomic<std::uint64_t> frames_;
};

} // namespace simcad
