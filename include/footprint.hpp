// ============================================================================
// footprint.hpp -- Spatial footprint synthesis for simulated cells
//
// A footprint is an axis-aligned anisotropic Gaussian density evaluated over
// the full H×W grid and min-max scaled to [0,1]. Centers are drawn at least
// `kFootprintPad` pixels away from every border.
// ============================================================================
#pragma once
#include <cstddef>

#include "random_source.hpp"
#include "sim_types.hpp"

namespace simcad {

inline constexpr std::size_t kFootprintPad = 5;

// ============================================================================
// `SigmaRange` struct
// Uniform range for per-axis Gaussian widths, in pixels.
// ============================================================================
struct SigmaRange {
  double lo { 3.0 };
  double hi { 4.0 };
};

// ============================================================================
// `FootprintParams` struct
// The random draws behind one footprint, kept for reporting.
// ============================================================================
struct FootprintParams {
  std::size_t center_y{0};
  std::size_t center_x{0};
  double      sigma_y{0.0};
  double      sigma_x{0.0};
};

// ============================================================================
// `CellFootprint` struct
// ============================================================================
struct CellFootprint {
  Footprint       plane;
  FootprintParams params;
  bool            degenerate{false};   // max == min, division skipped
};

/// Throws InvalidParameter if the grid cannot hold a padded center or the
/// sigma range is unusable (lo <= 0 or lo > hi).
void validate_footprint_geometry(std::size_t height, std::size_t width,
                                 const SigmaRange& sigma);

/// Evaluate the Gaussian density at every pixel (no normalization).
Footprint gaussian_density(std::size_t height, std::size_t width,
                           const FootprintParams& p);

/// Min-max scale in place. Returns false (degenerate) when max == min, in
/// which case only the minimum is subtracted.
bool normalize_footprint(Footprint& fp);

/// Draw center and sigmas from `rng` and build the footprint.
/// @param height    Frame height
/// @param width     Frame width
/// @param rng       The cell's footprint engine
/// @param sigma     Range for sigma_y and sigma_x
/// @param normalize Apply min-max scaling
CellFootprint generate_footprint(std::size_t height, std::size_t width,
                                 Engine& rng, const SigmaRange& sigma,
                                 bool normalize = true);

} // namespace simcad
