// ============================================================================
// compositor.cpp -- implementation of the FrameCompositor class
// ============================================================================
#include "compositor.hpp"

#include <algorithm>
#include <cstring>
#include <random>
#include <string>
#include <utility>

#include "errors.hpp"
#include "metrics.hpp"
#include "worker_pool.hpp"

namespace simcad {

RawFrame shift_frame(const RawFrame& src, Shift s, double fill) {
  const long long H = static_cast<long long>(src.height);
  const long long W = static_cast<long long>(src.width);
  RawFrame dst(src.height, src.width, fill);

  // destination block that still has a source pixel
  const long long y0 = std::max(0LL, static_cast<long long>(s.dy));
  const long long y1 = std::min(H, H + s.dy);
  const long long x0 = std::max(0LL, static_cast<long long>(s.dx));
  const long long x1 = std::min(W, W + s.dx);
  if (y1 <= y0 || x1 <= x0) return dst;

  const long long sy0 = std::max(0LL, -static_cast<long long>(s.dy));
  const long long sx0 = std::max(0LL, -static_cast<long long>(s.dx));
  const std::size_t run = static_cast<std::size_t>(x1 - x0);

  for (long long y = y0; y < y1; ++y) {
    const double* from = src.data.data() + (sy0 + (y - y0)) * W + sx0;
    double*       to   = dst.data.data() + y * W + x0;
    std::memcpy(to, from, run * sizeof(double));
  }
  return dst;
}

// ============================================================================
// `FrameCompositor` class
// ============================================================================
FrameCompositor::FrameCompositor(CompositorConfig cfg)
: cfg_(std::move(cfg)) {
  if (!(cfg_.noise_sigma >= 0.0)) {
    throw InvalidParameter("COMP: noise_sigma must be >= 0");
  }
}

RawFrame FrameCompositor::render_raw(const std::vector<Footprint>& footprints,
                                     const std::vector<CalciumTrace>& traces,
                                     std::size_t t) const {
  const std::size_t H = footprints.empty() ? 0 : footprints.front().height;
  const std::size_t W = footprints.empty() ? 0 : footprints.front().width;
  RawFrame raw(H, W, cfg_.background);

  for (std::size_t c = 0; c < footprints.size(); ++c) {
    const double amp = cfg_.snr_scale * traces[c][t];
    if (amp == 0.0) continue;
    const float* fp = footprints[c].data.data();
    double* out = raw.data.data();
    for (std::size_t i = 0, n = raw.size(); i < n; ++i) {
      out[i] += amp * static_cast<double>(fp[i]);
    }
  }
  return raw;
}

Movie FrameCompositor::composite(const std::vector<Footprint>& footprints,
                                 const std::vector<CalciumTrace>& traces,
                                 const MotionShift& motion,
                                 const RandomSource& rng,
                                 GenerationMetrics* metrics) const {
  if (footprints.empty()) {
    throw InvalidParameter("COMP: at least one footprint is required");
  }
  if (footprints.size() != traces.size()) {
    throw InvalidParameter("COMP: footprint count (" +
                           std::to_string(footprints.size()) +
                           ") != trace count (" +
                           std::to_string(traces.size()) + ")");
  }
  const std::size_t F = motion.size();
  const std::size_t H = footprints.front().height;
  const std::size_t W = footprints.front().width;
  for (std::size_t c = 0; c < footprints.size(); ++c) {
    if (footprints[c].height != H || footprints[c].width != W) {
      throw InvalidParameter("COMP: footprint shapes differ");
    }
    if (traces[c].size() != F) {
      throw InvalidParameter("COMP: trace length != motion length");
    }
  }

  Movie movie(F, H, W);

  parallel_for(F, cfg_.worker_threads, [&](std::size_t t) {
    RawFrame frame = render_raw(footprints, traces, t);
    if (motion[t].dy != 0 || motion[t].dx != 0) {
      frame = shift_frame(frame, motion[t], cfg_.background);
    }

    if (cfg_.noise_sigma > 0.0) {
      Engine eng = rng.stream(Stream::Noise, t);
      std::normal_distribution<double> nd(0.0, cfg_.noise_sigma);
      for (auto& v : frame.data) v += nd(eng);
    }

    std::uint8_t* px = movie.frame(t);
    for (std::size_t i = 0, n = frame.size(); i < n; ++i) {
      px[i] = quantize_pixel(frame.data[i]);
    }
    if (metrics) metrics->mark_frame_composited();
  });

  return movie;
}

} // namespace simcad
