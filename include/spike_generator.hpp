// ============================================================================
// spike_generator.hpp -- Per-cell binary spike-train synthesis
//
// Two strategies behind one interface:
//
// - MarkovSpikeGenerator: two-state {silent, spiking} Markov chain starting in
//   the silent state, driven by a 2×2 transition matrix.
// - HawkesSpikeGenerator: discrete-time self-exciting process. Each past
//   spike raises the per-frame firing probability by alpha, decaying with
//   time constant tau.
//
// Both reject all-zero trains and redraw, up to `max_retries` attempts, then
// throw GenerationExhausted.
// ============================================================================
#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <string>

#include "random_source.hpp"
#include "sim_types.hpp"

namespace simcad {

/// P[i][j] = probability of moving from state i to state j on the next frame.
using TransitionMatrix = std::array<std::array<double, 2>, 2>;

inline constexpr TransitionMatrix kDefaultTransitionMatrix{{
  {{0.98, 0.02}},
  {{0.02, 0.98}},
}};

// ============================================================================
// `HawkesParams` struct
// ============================================================================
struct HawkesParams {
  double mu    { 0.01 };   // baseline firing probability per frame, (0,1)
  double alpha { 0.05 };   // excitation added by one spike
  double tau   { 10.0 };   // excitation decay constant, frames
};

enum class SpikeStrategy { Markov, Hawkes };

// ============================================================================
// `SpikeConfig` struct
// Configuration for `make_spike_generator`
// ============================================================================
struct SpikeConfig {
  SpikeStrategy    strategy    { SpikeStrategy::Markov };
  TransitionMatrix transition  { kDefaultTransitionMatrix };
  HawkesParams     hawkes      {};
  int              max_retries { 1000 };
};

/// Throws InvalidParameter unless every entry is in [0,1] and each row sums
/// to 1 (|sum - 1| <= 1e-8 + 1e-5).
void validate_transition_matrix(const TransitionMatrix& P);

/// Throws InvalidParameter unless mu in (0,1), alpha > 0, tau > 0.
void validate_hawkes_params(const HawkesParams& p);

/// "markov" / "hawkes"
const char* to_string(SpikeStrategy s) noexcept;

/// Parse "markov" / "hawkes" (case-sensitive). Throws InvalidParameter.
SpikeStrategy parse_spike_strategy(const std::string& name);

// ============================================================================
// `SpikeGenerator` class
// Rejection-sampling wrapper around a single-attempt draw.
// ============================================================================
class SpikeGenerator {
public:
  explicit SpikeGenerator(int max_retries);
  virtual ~SpikeGenerator() = default;

  SpikeGenerator(const SpikeGenerator&) = delete;
  SpikeGenerator& operator=(const SpikeGenerator&) = delete;

  /// Draw a spike train with at least one spike.
  /// @param frame_count Length of the train
  /// @param rng         The cell's random engine
  /// @param attempts    If non-null, receives the number of draws used
  /// @return A train of `frame_count` values in {0,1}, not all zero
  SpikeTrain generate(std::size_t frame_count, Engine& rng,
                      int* attempts = nullptr) const;

  [[nodiscard]] int max_retries() const noexcept { return max_retries_; }
  [[nodiscard]] virtual SpikeStrategy strategy() const noexcept = 0;

protected:
  /// One unconditioned draw; may return an all-zero train.
  virtual SpikeTrain draw_once(std::size_t frame_count, Engine& rng) const = 0;

private:
  int max_retries_;
};

// ============================================================================
// `MarkovSpikeGenerator` class
// ============================================================================
class MarkovSpikeGenerator final : public SpikeGenerator {
public:
  explicit MarkovSpikeGenerator(const TransitionMatrix& P,
                                int max_retries = 1000);

  [[nodiscard]] SpikeStrategy strategy() const noexcept override {
    return SpikeStrategy::Markov;
  }
  [[nodiscard]] const TransitionMatrix& transition() const noexcept { return P_; }

protected:
  SpikeTrain draw_once(std::size_t frame_count, Engine& rng) const override;

private:
  TransitionMatrix P_;
};

// ============================================================================
// `HawkesSpikeGenerator` class
// Intensity lambda_i = mu + sum_{k<i, s[k]=1} alpha*exp(-(i-k)/tau), clamped
// to 1. The sum is carried forward as one decaying accumulator, O(N).
// ============================================================================
class HawkesSpikeGenerator final : public SpikeGenerator {
public:
  explicit HawkesSpikeGenerator(const HawkesParams& params,
                                int max_retries = 1000);

  [[nodiscard]] SpikeStrategy strategy() const noexcept override {
    return SpikeStrategy::Hawkes;
  }
  [[nodiscard]] const HawkesParams& params() const noexcept { return params_; }

protected:
  SpikeTrain draw_once(std::size_t frame_count, Engine& rng) const override;

private:
  HawkesParams params_;
  double       decay_;   // exp(-1/tau)
};

/// Build the generator selected by `cfg.strategy`. Validates parameters.
std::unique_ptr<SpikeGenerator> make_spike_generator(const SpikeConfig& cfg);

} // namespace simcad
