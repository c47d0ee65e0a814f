// ============================================================================
// compositor.hpp -- Frame compositing: footprints × traces → 8-bit movie
//
// Per frame t:
//   1. raw = background + snr * sum_c trace[c][t] * footprint[c]
//   2. translate raw by motion[t]; pixels with no source get `background`
//   3. add N(0, noise_sigma^2) i.i.d. per pixel
//   4. clip to [0,255], truncate to uint8
//
// Frames are independent and run on the worker pool. Frame t's noise comes
// from the (Noise, t) sub-stream, so the movie does not depend on the
// worker count.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "random_source.hpp"
#include "sim_types.hpp"

namespace simcad {

class GenerationMetrics;

// ============================================================================
// `CompositorConfig` struct
// Configuration for the `FrameCompositor` class
// ============================================================================
struct CompositorConfig {
  double   background     { 0.1 };   // scalar baseline added to every pixel
  double   noise_sigma    { 5.0 };   // std-dev of additive Gaussian noise
  double   snr_scale      { 1.0 };   // per-cell amplitude multiplier
  unsigned worker_threads { 0 };     // 0 => hardware_concurrency()
};

/// Translate `src` by `s` into a new frame. Destination pixels whose source
/// falls outside the grid take `fill`. No wrap-around.
RawFrame shift_frame(const RawFrame& src, Shift s, double fill);

/// Clip to [0,255] and truncate; NaN maps to 0.
inline std::uint8_t quantize_pixel(double v) noexcept {
  if (!(v > 0.0)) return 0;
  if (v >= 255.0) return 255;
  return static_cast<std::uint8_t>(v);
}

// ============================================================================
// `FrameCompositor` class
// ============================================================================
class FrameCompositor {
public:
  /// @param cfg The compositor configuration (validated here)
  explicit FrameCompositor(CompositorConfig cfg);

  [[nodiscard]] const CompositorConfig& config() const noexcept { return cfg_; }

  /// Noise-free, unshifted frame t (step 1 only).
  [[nodiscard]] RawFrame render_raw(const std::vector<Footprint>& footprints,
                                    const std::vector<CalciumTrace>& traces,
                                    std::size_t t) const;

  /// Build the full movie.
  /// @param footprints One H×W plane per cell
  /// @param traces     One trace per cell, each motion.size() long
  /// @param motion     One shift per frame
  /// @param rng        Random source; frame t uses the (Noise, t) stream
  /// @param metrics    Optional counters (frames composited)
  [[nodiscard]] Movie composite(const std::vector<Footprint>& footprints,
                                const std::vector<CalciumTrace>& traces,
                                const MotionShift& motion,
                                const RandomSource& rng,
                                GenerationMetrics* metrics = nullptr) const;

private:
  CompositorConfig cfg_;
};

} // namespace simcad
