// ============================================================================
// motion.hpp -- Smoothed random drift trajectory
//
// Per axis: i.i.d. N(0, (max_shift/3)^2) per frame, Gaussian-smoothed along
// the frame index, rounded to the nearest integer (ties to even). The
// smoothing correlates neighbouring frames so the trajectory drifts rather
// than jitters.
// ============================================================================
#pragma once
#include <cstddef>
#include <vector>

#include "random_source.hpp"
#include "sim_types.hpp"

namespace simcad {

/// Normalized Gaussian weights on [-r, r], r = int(truncate*sigma + 0.5).
std::vector<double> gaussian_kernel1d(double sigma, double truncate = 4.0);

/// 1D Gaussian smoothing with half-sample symmetric ("reflect") boundary
/// handling. sigma <= 0 returns the input unchanged.
std::vector<double> gaussian_filter1d(const std::vector<double>& in,
                                      double sigma, double truncate = 4.0);

/// Generate one (dy, dx) shift per frame.
/// @param frame_count     Number of frames
/// @param max_shift       Approximate shift scale in pixels (>= 0)
/// @param smoothing_sigma Gaussian sigma along the frame axis (>= 0)
/// @param rng             The motion engine
MotionShift generate_motion(std::size_t frame_count, int max_shift,
                            double smoothing_sigma, Engine& rng);

} // namespace simcad
