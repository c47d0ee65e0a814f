// ============================================================================
// spike_generator.cpp -- implementation of the spike-train strategies
// ============================================================================
#include "spike_generator.hpp"

#include <cmath>
#include <cstdio>

#include "errors.hpp"

namespace simcad {

// ============================================================================
// Parameter validation
// ============================================================================
void validate_transition_matrix(const TransitionMatrix& P) {
  for (std::size_t i = 0; i < 2; ++i) {
    for (std::size_t j = 0; j < 2; ++j) {
      const double p = P[i][j];
      if (!(p >= 0.0 && p <= 1.0)) {
        throw InvalidParameter("SPK: transition matrix entries must lie in [0,1]");
      }
    }
    const double row = P[i][0] + P[i][1];
    if (!(std::fabs(row - 1.0) <= 1e-8 + 1e-5)) {
      char buf[128];
      std::snprintf(buf, sizeof(buf),
                    "SPK: transition matrix row %zu sums to %.9g, expected 1",
                    i, row);
      throw InvalidParameter(buf);
    }
  }
}

void validate_hawkes_params(const HawkesParams& p) {
  if (!(p.mu > 0.0 && p.mu < 1.0)) {
    throw InvalidParameter("SPK: hawkes mu must lie in (0,1)");
  }
  if (!(p.alpha > 0.0)) {
    throw InvalidParameter("SPK: hawkes alpha must be > 0");
  }
  if (!(p.tau > 0.0)) {
    throw InvalidParameter("SPK: hawkes tau must be > 0");
  }
}

const char* to_string(SpikeStrategy s) noexcept {
  switch (s) {
    case SpikeStrategy::Markov: return "markov";
    case SpikeStrategy::Hawkes: return "hawkes";
  }
  return "unknown";
}

SpikeStrategy parse_spike_strategy(const std::string& name) {
  if (name == "markov") return SpikeStrategy::Markov;
  if (name == "hawkes") return SpikeStrategy::Hawkes;
  throw InvalidParameter("SPK: unknown spike strategy '" + name +
                         "' (expected markov or hawkes)");
}

// ============================================================================
// `SpikeGenerator` class
// ============================================================================
SpikeGenerator::SpikeGenerator(int max_retries)
: max_retries_{max_retries} {
  if (max_retries_ < 1) {
    throw InvalidParameter("SPK: max_spike_retries must be >= 1");
  }
}

SpikeTrain SpikeGenerator::generate(std::size_t frame_count, Engine& rng,
                                    int* attempts) const {
  if (frame_count == 0) {
    throw InvalidParameter("SPK: frame_count must be > 0");
  }

  for (int attempt = 1; attempt <= max_retries_; ++attempt) {
    SpikeTrain train = draw_once(frame_count, rng);
    for (auto s : train) {
      if (s != 0) {
        if (attempts) *attempts = attempt;
        return train;
      }
    }
  }

  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "SPK: %s generator produced no spike in %d attempts "
                "(%zu frames)",
                to_string(strategy()), max_retries_, frame_count);
  throw GenerationExhausted(buf, max_retries_);
}

// ============================================================================
// `MarkovSpikeGenerator` class
// ============================================================================
MarkovSpikeGenerator::MarkovSpikeGenerator(const TransitionMatrix& P,
                                           int max_retries)
: SpikeGenerator(max_retries), P_{P} {
  validate_transition_matrix(P_);
}

SpikeTrain MarkovSpikeGenerator::draw_once(std::size_t frame_count,
                                           Engine& rng) const {
  std::uniform_real_distribution<double> u01(0.0, 1.0);
  SpikeTrain s(frame_count, 0);

  // state[0] is fixed to silent
  for (std::size_t i = 1; i < frame_count; ++i) {
    const auto& row = P_[s[i - 1]];
    s[i] = (u01(rng) < row[0]) ? 0u : 1u;
  }
  return s;
}

// ============================================================================
// `HawkesSpikeGenerator` class
// ============================================================================
HawkesSpikeGenerator::HawkesSpikeGenerator(const HawkesParams& params,
                                           int max_retries)
: SpikeGenerator(max_retries), params_{params}, decay_{0.0} {
  validate_hawkes_params(params_);
  decay_ = std::exp(-1.0 / params_.tau);
}

SpikeTrain HawkesSpikeGenerator::draw_once(std::size_t frame_count,
                                           Engine& rng) const {
  std::uniform_real_distribution<double> u01(0.0, 1.0);
  SpikeTrain s(frame_count, 0);

  // excite == sum over past spikes k of alpha*exp(-(i-k)/tau) at frame i
  double excite = 0.0;
  for (std::size_t i = 0; i < frame_count; ++i) {
    double lambda = params_.mu + excite;
    if (lambda > 1.0) lambda = 1.0;

    if (u01(rng) < lambda) s[i] = 1;

    if (s[i]) excite += params_.alpha;
    excite *= decay_;
  }
  return s;
}

// ============================================================================
// Factory
// ============================================================================
std::unique_ptr<SpikeGenerator> make_spike_generator(const SpikeConfig& cfg) {
  switch (cfg.strategy) {
    case SpikeStrategy::Markov:
      return std::make_unique<MarkovSpikeGenerator>(cfg.transition,
                                                    cfg.max_retries);
    case SpikeStrategy::Hawkes:
      return std::make_unique<HawkesSpikeGenerator>(cfg.hawkes,
                                                    cfg.max_retries);
  }
  throw InvalidParameter("SPK: unknown spike strategy");
}

} // namespace simcad
