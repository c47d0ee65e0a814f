// ============================================================================
// calcium_filter.hpp -- Spike train to calcium fluorescence trace
//
// Two causal filters model indicator dynamics (fast rise, slow decay):
//
// - AR(2): C[n] = s[n] + theta1*C[n-1] + theta2*C[n-2], with
//   theta1 = z_d + z_r, theta2 = -z_d*z_r, z = exp(-1/tau).
// - Bi-exponential: causal convolution of s with
//   k(t) = exp(-t/tau_decay) - exp(-t/tau_rise), truncated to len(s).
//
// tau_decay > tau_rise is the intended regime but only tau > 0 is enforced.
// ============================================================================
#pragma once
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "sim_types.hpp"

namespace simcad {

enum class CalciumStrategy { AR2, BiExp };

inline const char* to_string(CalciumStrategy s) noexcept {
  return s == CalciumStrategy::AR2 ? "ar2" : "biexp";
}

/// Parse "ar2" / "biexp". Throws InvalidParameter.
inline CalciumStrategy parse_calcium_strategy(const std::string& name) {
  if (name == "ar2")   return CalciumStrategy::AR2;
  if (name == "biexp") return CalciumStrategy::BiExp;
  throw InvalidParameter("CAL: unknown calcium strategy '" + name +
                         "' (expected ar2 or biexp)");
}

// ============================================================================
// Filter primitives
// ============================================================================
/// AR(2) feedback coefficients (theta1, theta2) for the two time constants.
inline std::pair<double, double> ar2_coeffs(double tau_decay, double tau_rise) {
  const double z1 = std::exp(-1.0 / tau_decay);
  const double z2 = std::exp(-1.0 / tau_rise);
  return { z1 + z2, -z1 * z2 };
}

/// Run the AR(2) recurrence over a spike train.
inline CalciumTrace apply_ar2_filter(const SpikeTrain& spikes,
                                     std::pair<double, double> theta) {
  const auto [theta1, theta2] = theta;
  CalciumTrace c(spikes.size(), 0.0);
  for (std::size_t n = 0; n < spikes.size(); ++n) {
    double v = static_cast<double>(spikes[n]);
    if (n >= 1) v += theta1 * c[n - 1];
    if (n >= 2) v += theta2 * c[n - 2];
    c[n] = v;
  }
  return c;
}

/// Difference-of-exponentials kernel sampled at t = 0..length-1.
inline std::vector<double> biexp_kernel(std::size_t length,
                                        double tau_decay, double tau_rise) {
  std::vector<double> k(length);
  for (std::size_t t = 0; t < length; ++t) {
    const double td = static_cast<double>(t);
    k[t] = std::exp(-td / tau_decay) - std::exp(-td / tau_rise);
  }
  return k;
}

/// Causal convolution of the spike train with the bi-exponential kernel,
/// first len(spikes) samples of the full convolution.
inline CalciumTrace apply_biexp_filter(const SpikeTrain& spikes,
                                       double tau_decay, double tau_rise) {
  const std::size_t N = spikes.size();
  const auto kernel = biexp_kernel(N, tau_decay, tau_rise);
  CalciumTrace c(N, 0.0);
  // spikes are sparse: scatter each one's kernel instead of gathering
  for (std::size_t k = 0; k < N; ++k) {
    if (!spikes[k]) continue;
    const double amp = static_cast<double>(spikes[k]);
    for (std::size_t n = k; n < N; ++n) c[n] += amp * kernel[n - k];
  }
  return c;
}

// ============================================================================
// `CalciumFilter` class
// Strategy + time constants, validated once at construction.
// ============================================================================
class CalciumFilter {
public:
  /// @param strategy  AR2 or BiExp
  /// @param tau_decay Decay time constant in frames (> 0)
  /// @param tau_rise  Rise time constant in frames (> 0)
  CalciumFilter(CalciumStrategy strategy, double tau_decay, double tau_rise)
  : strategy_{strategy}, tau_decay_{tau_decay}, tau_rise_{tau_rise} {
    if (!(tau_decay_ > 0.0) || !(tau_rise_ > 0.0)) {
      throw InvalidParameter("CAL: tau_decay and tau_rise must be > 0");
    }
    theta_ = ar2_coeffs(tau_decay_, tau_rise_);
  }

  [[nodiscard]] CalciumStrategy strategy() const noexcept { return strategy_; }
  [[nodiscard]] double tau_decay() const noexcept { return tau_decay_; }
  [[nodiscard]] double tau_rise() const noexcept { return tau_rise_; }
  [[nodiscard]] std::pair<double, double> theta() const noexcept { return theta_; }

  /// Filter one cell's spike train.
  [[nodiscard]] CalciumTrace apply(const SpikeTrain& spikes) const {
    if (strategy_ == CalciumStrategy::AR2) {
      return apply_ar2_filter(spikes, theta_);
    }
    return apply_biexp_filter(spikes, tau_decay_, tau_rise_);
  }

private:
  CalciumStrategy           strategy_;
  double                    tau_decay_;
  double                    tau_rise_;
  std::pair<double, double> theta_{};
};

} // namespace simcad
