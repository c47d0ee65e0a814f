// ============================================================================
// footprint.cpp -- implementation of the Gaussian footprint synthesizer
// ============================================================================
#include "footprint.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <string>

#include "errors.hpp"

namespace simcad {

void validate_footprint_geometry(std::size_t height, std::size_t width,
                                 const SigmaRange& sigma) {
  if (height <= 2 * kFootprintPad || width <= 2 * kFootprintPad) {
    throw InvalidParameter(
      "FOOT: frame " + std::to_string(height) + "x" + std::to_string(width) +
      " too small, each side must exceed " +
      std::to_string(2 * kFootprintPad) + " pixels");
  }
  if (!(sigma.lo > 0.0) || !(sigma.hi >= sigma.lo)) {
    throw InvalidParameter("FOOT: sigma range must satisfy 0 < lo <= hi");
  }
}

Footprint gaussian_density(std::size_t height, std::size_t width,
                           const FootprintParams& p) {
  Footprint fp(height, width, 0.0f);
  const double norm = 1.0 / (2.0 * std::numbers::pi * p.sigma_y * p.sigma_x);
  const double iy = 1.0 / (p.sigma_y * p.sigma_y);
  const double ix = 1.0 / (p.sigma_x * p.sigma_x);

  // separable: exp(a+b) = exp(a)*exp(b), one column table per footprint
  std::vector<double> gx(width);
  for (std::size_t x = 0; x < width; ++x) {
    const double dx = static_cast<double>(x) - static_cast<double>(p.center_x);
    gx[x] = std::exp(-0.5 * dx * dx * ix);
  }
  for (std::size_t y = 0; y < height; ++y) {
    const double dy = static_cast<double>(y) - static_cast<double>(p.center_y);
    const double gy = norm * std::exp(-0.5 * dy * dy * iy);
    float* row = fp.data.data() + y * width;
    for (std::size_t x = 0; x < width; ++x) {
      row[x] = static_cast<float>(gy * gx[x]);
    }
  }
  return fp;
}

bool normalize_footprint(Footprint& fp) {
  if (fp.data.empty()) return false;
  const auto [mn_it, mx_it] = std::minmax_element(fp.data.begin(), fp.data.end());
  const float mn = *mn_it;
  const float mx = *mx_it;

  if (mx > mn) {
    const float range = mx - mn;
    for (auto& v : fp.data) v = (v - mn) / range;
    return true;
  }
  for (auto& v : fp.data) v -= mn;
  return false;
}

CellFootprint generate_footprint(std::size_t height, std::size_t width,
                                 Engine& rng, const SigmaRange& sigma,
                                 bool normalize) {
  validate_footprint_geometry(height, width, sigma);

  std::uniform_int_distribution<std::size_t> cy(kFootprintPad,
                                                height - kFootprintPad - 1);
  std::uniform_int_distribution<std::size_t> cx(kFootprintPad,
                                                width - kFootprintPad - 1);
  std::uniform_real_distribution<double> sd(sigma.lo, sigma.hi);

  CellFootprint out;
  out.params.center_y = cy(rng);
  out.params.center_x = cx(rng);
  out.params.sigma_y  = sd(rng);
  out.params.sigma_x  = sd(rng);

  out.plane = gaussian_density(height, width, out.params);
  if (normalize) {
    out.degenerate = !normalize_footprint(out.plane);
  }
  return out;
}

} // namespace simcad
