// ============================================================================
// movie_builder.hpp -- Orchestrator for synthetic calcium-imaging movies
//
// MovieBuilder wires the generation stages together for one configuration:
//
// - MotionModel: one smoothed (dy, dx) trajectory for the whole movie.
// - FootprintSynthesizer: one Gaussian footprint per cell.
// - SpikeGenerator → CalciumFilter: one spike train and trace per cell.
// - FrameCompositor: footprints × traces + background, motion, noise → uint8.
//
// Types and interfaces defined:
// - MovieConfig: every generation knob (dimensions, strategies, rendering,
//   seed, worker count).
// - MovieResult: the movie plus all ground truth that produced it.
// - MovieBuilder: validates a MovieConfig up front and runs the pipeline.
//
// A build either returns a complete MovieResult or throws; no partial
// result escapes. Per-cell and per-frame stages run on the worker pool with
// index-addressed random sub-streams, so the output for a given seed is the
// same for any worker count.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "calcium_filter.hpp"
#include "footprint.hpp"
#include "sim_types.hpp"
#include "spike_generator.hpp"

namespace simcad {

class GenerationMetrics;

// ============================================================================
// `MovieConfig` struct
// Configuration for the `MovieBuilder` class
// ============================================================================
struct MovieConfig {
  int num_cells  { 60 };
  int num_frames { 300 };
  int height     { 512 };
  int width      { 512 };

  SpikeConfig     spikes           {};                      // strategy + params
  CalciumStrategy calcium_strategy { CalciumStrategy::AR2 };
  double          tau_decay        { 10.0 };                // frames
  double          tau_rise         { 4.0 };                 // frames

  double     cell_snr               { 1.0 };    // per-cell amplitude scale
  double     background_strength    { 0.1 };    // baseline on every pixel
  double     motion_smoothing_sigma { 5.0 };    // frames
  int        max_shift              { 0 };      // pixels, 0 = no motion
  double     noise_sigma            { 5.0 };    // additive Gaussian noise
  SigmaRange footprint_sigma_range  {};         // [3, 4] px
  bool       normalize_footprints   { true };

  std::int64_t rng_seed       { -1 };   // < 0 => draw from std::random_device
  unsigned     worker_threads { 0 };    // 0 => hardware_concurrency()
  bool         verbose        { true }; // progress lines on stdout
};

/// Throws InvalidParameter on the first inadmissible value.
void validate_movie_config(const MovieConfig& cfg);

// ============================================================================
// `MovieResult` struct
// ============================================================================
struct MovieResult {
  Movie                        movie;             // F×H×W uint8
  std::vector<Footprint>       footprints;        // C planes, H×W
  std::vector<FootprintParams> footprint_params;  // centers and sigmas
  std::vector<CalciumTrace>    traces;            // C×F
  std::vector<SpikeTrain>      spikes;            // C×F
  MotionShift                  motion;            // F shifts
  std::uint64_t                seed{0};           // seed actually used
  std::size_t                  degenerate_footprints{0};
};

// ============================================================================
// `MovieBuilder` class
// ============================================================================
class MovieBuilder {
public:
  /// Validates `cfg`; throws InvalidParameter.
  explicit MovieBuilder(MovieConfig cfg);
  ~MovieBuilder();

  MovieBuilder(const MovieBuilder&) = delete;
  MovieBuilder& operator=(const MovieBuilder&) = delete;

  [[nodiscard]] const MovieConfig& config() const noexcept;

  /// Run the full pipeline.
  /// @param metrics Optional run counters
  /// @return The movie and its ground truth
  MovieResult build(GenerationMetrics* metrics = nullptr) const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// One-shot convenience wrapper around MovieBuilder.
MovieResult generate_movie(const MovieConfig& cfg,
                           GenerationMetrics* metrics = nullptr);

} // namespace simcad
