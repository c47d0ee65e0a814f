// ============================================================================
// motion.cpp -- implementation of the drift trajectory model
// ============================================================================
#include "motion.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

#include "errors.hpp"

namespace simcad {

/// Map an out-of-range index onto [0, n) by mirroring about the edges,
/// edge sample repeated: (d c b a | a b c d | d c b a).
static inline std::size_t reflect_index(long long i, long long n) {
  const long long period = 2 * n;
  long long m = i % period;
  if (m < 0) m += period;
  if (m >= n) m = period - 1 - m;
  return static_cast<std::size_t>(m);
}

std::vector<double> gaussian_kernel1d(double sigma, double truncate) {
  const long long radius = static_cast<long long>(truncate * sigma + 0.5);
  std::vector<double> w(static_cast<std::size_t>(2 * radius + 1));
  const double inv2s2 = 1.0 / (2.0 * sigma * sigma);
  double sum = 0.0;
  for (long long k = -radius; k <= radius; ++k) {
    const double v = std::exp(-static_cast<double>(k * k) * inv2s2);
    w[static_cast<std::size_t>(k + radius)] = v;
    sum += v;
  }
  for (auto& v : w) v /= sum;
  return w;
}

std::vector<double> gaussian_filter1d(const std::vector<double>& in,
                                      double sigma, double truncate) {
  if (!(sigma > 0.0) || in.empty()) return in;

  const auto w = gaussian_kernel1d(sigma, truncate);
  const long long radius = static_cast<long long>(w.size() / 2);
  const long long n = static_cast<long long>(in.size());

  std::vector<double> out(in.size(), 0.0);
  for (long long i = 0; i < n; ++i) {
    double acc = 0.0;
    for (long long k = -radius; k <= radius; ++k) {
      acc += w[static_cast<std::size_t>(k + radius)] * in[reflect_index(i + k, n)];
    }
    out[static_cast<std::size_t>(i)] = acc;
  }
  return out;
}

MotionShift generate_motion(std::size_t frame_count, int max_shift,
                            double smoothing_sigma, Engine& rng) {
  if (max_shift < 0) {
    throw InvalidParameter("MOT: max_shift must be >= 0");
  }
  if (!(smoothing_sigma >= 0.0)) {
    throw InvalidParameter("MOT: motion smoothing sigma must be >= 0");
  }

  MotionShift shifts(frame_count);
  if (max_shift == 0 || frame_count == 0) return shifts;

  // row-major (frame, axis) draws: frame 0 dy, frame 0 dx, frame 1 dy, ...
  std::normal_distribution<double> nd(0.0, static_cast<double>(max_shift) / 3.0);
  std::vector<double> dy(frame_count), dx(frame_count);
  for (std::size_t t = 0; t < frame_count; ++t) {
    dy[t] = nd(rng);
    dx[t] = nd(rng);
  }

  dy = gaussian_filter1d(dy, smoothing_sigma);
  dx = gaussian_filter1d(dx, smoothing_sigma);

  // saturate before the cast, out-of-range double -> int is undefined
  const auto to_int = [](double v) {
    const double lim = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(std::nearbyint(v), -lim, lim));
  };
  for (std::size_t t = 0; t < frame_count; ++t) {
    shifts[t].dy = to_int(dy[t]);
    shifts[t].dx = to_int(dx[t]);
  }
  return shifts;
}

} // namespace simcad
