// ============================================================================
// movie_builder.cpp -- implementation of the MovieBuilder class
// ============================================================================
#include "movie_builder.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>
#include <utility>

#include "compositor.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "motion.hpp"
#include "random_source.hpp"
#include "worker_pool.hpp"

namespace simcad {

void validate_movie_config(const MovieConfig& cfg) {
  if (cfg.num_cells <= 0) {
    throw InvalidParameter("SIM: num_cells must be > 0");
  }
  if (cfg.num_frames <= 0) {
    throw InvalidParameter("SIM: num_frames must be > 0");
  }
  if (cfg.height <= 0 || cfg.width <= 0) {
    throw InvalidParameter("SIM: height and width must be > 0");
  }
  validate_footprint_geometry(static_cast<std::size_t>(cfg.height),
                              static_cast<std::size_t>(cfg.width),
                              cfg.footprint_sigma_range);

  if (cfg.spikes.max_retries < 1) {
    throw InvalidParameter("SIM: max_spike_retries must be >= 1");
  }
  if (cfg.spikes.strategy == SpikeStrategy::Markov) {
    validate_transition_matrix(cfg.spikes.transition);
  } else {
    validate_hawkes_params(cfg.spikes.hawkes);
  }

  if (!(cfg.tau_decay > 0.0) || !(cfg.tau_rise > 0.0)) {
    throw InvalidParameter("SIM: tau_decay and tau_rise must be > 0");
  }
  if (cfg.max_shift < 0) {
    throw InvalidParameter("SIM: max_shift must be >= 0");
  }
  if (cfg.max_shift > std::max(cfg.height, cfg.width)) {
    throw InvalidParameter("SIM: max_shift must not exceed the frame size");
  }
  if (!(cfg.motion_smoothing_sigma >= 0.0)) {
    throw InvalidParameter("SIM: motion_smoothing_sigma must be >= 0");
  }
  if (!(cfg.noise_sigma >= 0.0)) {
    throw InvalidParameter("SIM: noise_sigma must be >= 0");
  }
}

// ============================================================================
// `Impl` class
// Holds the validated config and the stage objects built from it.
// ============================================================================
struct MovieBuilder::Impl {
  MovieConfig                     cfg;
  std::unique_ptr<SpikeGenerator> spike_gen;
  CalciumFilter                   calcium;
  FrameCompositor                 compositor;

  explicit Impl(MovieConfig cfg_)
  : cfg(std::move(cfg_)),
    spike_gen(make_spike_generator(cfg.spikes)),
    calcium(cfg.calcium_strategy, cfg.tau_decay, cfg.tau_rise),
    compositor(CompositorConfig{
      cfg.background_strength,
      cfg.noise_sigma,
      cfg.cell_snr,
      cfg.worker_threads
    }) {}

  void log_plan(std::uint64_t seed) const {
    if (!cfg.verbose) return;
    std::printf("SIM: seed=%llu cells=%d frames=%d size=%dx%d\n",
                (unsigned long long)seed, cfg.num_cells, cfg.num_frames,
                cfg.height, cfg.width);
    std::printf("SIM: spikes=%s calcium=%s (tau_decay=%.3g tau_rise=%.3g)\n",
                to_string(cfg.spikes.strategy),
                to_string(cfg.calcium_strategy),
                cfg.tau_decay, cfg.tau_rise);
    std::printf("SIM: snr=%.3g background=%.3g noise_sigma=%.3g "
                "max_shift=%d smoothing=%.3g workers=%u\n",
                cfg.cell_snr, cfg.background_strength, cfg.noise_sigma,
                cfg.max_shift, cfg.motion_smoothing_sigma,
                resolve_worker_threads(cfg.worker_threads));
  }

  MovieResult build(GenerationMetrics* metrics) const {
    const std::size_t C = static_cast<std::size_t>(cfg.num_cells);
    const std::size_t F = static_cast<std::size_t>(cfg.num_frames);
    const std::size_t H = static_cast<std::size_t>(cfg.height);
    const std::size_t W = static_cast<std::size_t>(cfg.width);

    const std::uint64_t seed = cfg.rng_seed >= 0
      ? static_cast<std::uint64_t>(cfg.rng_seed)
      : RandomSource::entropy_seed();
    const RandomSource rng(seed);
    log_plan(seed);

    MovieResult out;
    out.seed = seed;

    // Motion: one trajectory, one stream
    {
      Engine eng = rng.stream(Stream::Motion);
      out.motion = generate_motion(F, cfg.max_shift,
                                   cfg.motion_smoothing_sigma, eng);
    }

    // Footprints: one stream per cell
    out.footprints.resize(C);
    out.footprint_params.resize(C);
    std::vector<std::uint8_t> degenerate(C, 0);
    parallel_for(C, cfg.worker_threads, [&](std::size_t c) {
      Engine eng = rng.stream(Stream::Footprint, c);
      CellFootprint fp = generate_footprint(H, W, eng,
                                            cfg.footprint_sigma_range,
                                            cfg.normalize_footprints);
      if (fp.degenerate) {
        std::fprintf(stderr,
                     "FOOT: warning: cell %zu footprint is flat "
                     "(max == min), left unscaled\n", c);
      }
      degenerate[c]           = fp.degenerate ? 1u : 0u;
      out.footprint_params[c] = fp.params;
      out.footprints[c]       = std::move(fp.plane);
      if (metrics) metrics->mark_footprint(fp.degenerate);
    });
    out.degenerate_footprints =
      std::accumulate(degenerate.begin(), degenerate.end(), std::size_t{0});

    // Spikes → traces: one stream per cell, sequential within a cell
    out.spikes.resize(C);
    out.traces.resize(C);
    std::vector<int> attempts(C, 0);
    parallel_for(C, cfg.worker_threads, [&](std::size_t c) {
      Engine eng = rng.stream(Stream::Spikes, c);
      out.spikes[c] = spike_gen->generate(F, eng, &attempts[c]);
      out.traces[c] = calcium.apply(out.spikes[c]);
      if (metrics) {
        const auto n = std::accumulate(out.spikes[c].begin(),
                                       out.spikes[c].end(), std::uint64_t{0});
        metrics->mark_cell(static_cast<std::uint64_t>(attempts[c]), n);
      }
    });

    if (cfg.verbose) {
      const long long total = std::accumulate(attempts.begin(), attempts.end(), 0LL);
      std::printf("SIM: spike trains ready (%lld draws for %zu cells)\n",
                  total, C);
    }

    out.movie = compositor.composite(out.footprints, out.traces, out.motion,
                                     rng, metrics);

    if (cfg.verbose) {
      std::printf("SIM: movie %zux%zux%zu composited\n", F, H, W);
    }
    return out;
  }
};

// ============================================================================
// `MovieBuilder` class
// ============================================================================
MovieBuilder::MovieBuilder(MovieConfig cfg) {
  validate_movie_config(cfg);
  impl_ = std::make_unique<Impl>(std::move(cfg));
}

MovieBuilder::~MovieBuilder() = default;

const MovieConfig& MovieBuilder::config() const noexcept {
  return impl_->cfg;
}

MovieResult MovieBuilder::build(GenerationMetrics* metrics) const {
  return impl_->build(metrics);
}

MovieResult generate_movie(const MovieConfig& cfg, GenerationMetrics* metrics) {
  MovieBuilder builder(cfg);
  return builder.build(metrics);
}

} // namespace simcad
